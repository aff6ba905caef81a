// server_https.cpp
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "api_json.h"
#include "config.h"
#include "date_selector.h"
#include "logger.h"
#include "model.h"
#include "schedule_service.h"
#include "vision_client.h"

using nlohmann::json;

static const char* kJsonType = "application/json; charset=utf-8";

static void setCors(httplib::Response& res, const char* methods) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", methods);
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

static void preflight(httplib::SSLServer& svr, const std::string& path, const char* methods) {
    svr.Options(path, [methods](const httplib::Request&, httplib::Response& res) {
        setCors(res, methods);
        res.status = 204;
    });
}

static void sendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), kJsonType);
}

// Общая обёртка для POST с JSON-телом: 400 на битый JSON, 500 на остальное.
template <typename Handler>
static void postJson(httplib::SSLServer& svr, const std::string& path, Handler handler) {
    svr.Post(path, [path, handler](const httplib::Request& req, httplib::Response& res) {
        setCors(res, "POST, OPTIONS");
        try {
            json body = req.body.empty() ? json::object() : json::parse(req.body);
            sendJson(res, handler(body));
        } catch (const json::exception& ex) {
            logError("Bad request in POST " + path + ": " + ex.what());
            sendJson(res, {{"error", "invalid JSON"}, {"detail", ex.what()}}, 400);
        } catch (const std::invalid_argument& ex) {
            logError("Bad request in POST " + path + ": " + ex.what());
            sendJson(res, {{"error", "invalid request"}, {"detail", ex.what()}}, 400);
        } catch (const std::exception& ex) {
            logError("Error in POST " + path + ": " + ex.what());
            sendJson(res, {{"error", "internal server error"}}, 500);
        }
    });
    preflight(svr, path, "POST, OPTIONS");
}

int main() {
    try {
        AppConfig cfg = AppConfig::fromEnv();
        initLogger(cfg.logging);

        logInfo("=== Запуск HTTPS сервера на " + cfg.host + ":" + std::to_string(cfg.port) + " ===");
        logInfo("Ёмкость: " + std::to_string(cfg.capacity.studentsPerLab) + " на лабораторию (" +
                std::to_string(cfg.capacity.forenoonCapacity) + "+" +
                std::to_string(cfg.capacity.afternoonCapacity) + "), лабораторий в день " +
                std::to_string(cfg.capacity.labsPerDay));
        if (!cfg.vision.enabled()) {
            logWarning("GROQ_API_KEY не задан: распознавание изображений выключено");
        }

        const vision::BackendList backends = vision::makeDefaultBackends(cfg.vision);

        httplib::SSLServer svr(cfg.certPath.c_str(), cfg.keyPath.c_str());

        if (!svr.is_valid()) {
            logError("SSLServer невалиден. Проверь " + cfg.certPath + " и " + cfg.keyPath);
            return 1;
        }

        // --- корень ---
        svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_content(
                "HTTPS exam lab scheduler is running.\n"
                "GET  /api/health\n"
                "POST /api/schedule/generate\n"
                "POST /api/schedule/validate\n"
                "POST /api/schedule/auto-select-dates\n"
                "POST /api/schedule/calculate-requirements\n"
                "POST /api/upload/parse-file      (multipart, field 'file')\n"
                "POST /api/upload/analyze-image   (multipart, field 'file')\n",
                "text/plain; charset=utf-8"
            );
        });

        svr.Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
            setCors(res, "GET, OPTIONS");
            sendJson(res, {{"status", "healthy"}, {"service", "exam-scheduler"}});
        });
        preflight(svr, "/api/health", "GET, OPTIONS");

        // --- генерация и проверка ---
        postJson(svr, "/api/schedule/generate", [&cfg](const json& body) {
            ScheduleRequest request = body.get<ScheduleRequest>();
            logInfo("POST /api/schedule/generate students=" +
                    std::to_string(request.allRegisterNumbers().size()) +
                    " dates=" + std::to_string(request.allDates().size()) +
                    " labs=" + std::to_string(request.labs.size()));
            return json(generateSchedule(request, cfg.capacity));
        });

        postJson(svr, "/api/schedule/validate", [&cfg](const json& body) {
            ScheduleRequest request = body.get<ScheduleRequest>();
            return json(validateSchedule(request, cfg.capacity));
        });

        // --- подбор дат ---
        postJson(svr, "/api/schedule/auto-select-dates", [&cfg](const json& body) {
            std::vector<std::string> available = body.value("available_dates", std::vector<std::string>{});
            int studentCount = body.value("student_count", 0);
            int minGap       = body.value("min_gap_days", 1);
            std::vector<std::string> subjects;
            if (body.contains("subjects") && body["subjects"].is_array()) {
                subjects = body["subjects"].get<std::vector<std::string>>();
            }

            logInfo("POST /api/schedule/auto-select-dates students=" + std::to_string(studentCount) +
                    " available=" + std::to_string(available.size()) +
                    " minGap=" + std::to_string(minGap));
            return json(autoSelectDates(available, studentCount, minGap, subjects, cfg.capacity));
        });

        postJson(svr, "/api/schedule/calculate-requirements", [&cfg](const json& body) {
            int studentCount   = body.value("student_count", 0);
            int availableDates = body.value("available_dates", 0);
            return json(calculateRequirements(studentCount, availableDates, cfg.capacity));
        });

        // --- загрузка файлов ---
        svr.Post("/api/upload/parse-file", [](const httplib::Request& req, httplib::Response& res) {
            setCors(res, "POST, OPTIONS");

            if (!req.has_file("file")) {
                sendJson(res, {{"success", false}, {"error", "field 'file' is required"},
                               {"semesters", json::array()}, {"total_students", 0}}, 400);
                return;
            }
            const auto file = req.get_file_value("file");

            try {
                sendJson(res, json(parseUploadedFile(file.filename, file.content)));
            } catch (const std::exception& ex) {
                logError(std::string("Error in /api/upload/parse-file: ") + ex.what());
                UploadResponse failed;
                failed.error = ex.what();
                sendJson(res, json(failed));
            }
        });
        preflight(svr, "/api/upload/parse-file", "POST, OPTIONS");

        svr.Post("/api/upload/analyze-image", [&cfg, &backends](const httplib::Request& req, httplib::Response& res) {
            setCors(res, "POST, OPTIONS");

            if (!req.has_file("file")) {
                sendJson(res, {{"success", false}, {"error", "field 'file' is required"},
                               {"semesters", json::array()}, {"extracted_data", nullptr},
                               {"raw_response", nullptr}}, 400);
                return;
            }
            const auto file = req.get_file_value("file");

            logInfo("POST /api/upload/analyze-image bytes=" + std::to_string(file.content.size()) +
                    " type=" + file.content_type);

            try {
                sendJson(res, json(analyzeUploadedImage(file.content, file.content_type, backends, cfg.vision)));
            } catch (const std::exception& ex) {
                logError(std::string("Error in /api/upload/analyze-image: ") + ex.what());
                UploadResponse failed;
                failed.error = std::string("Error processing image: ") + ex.what();
                sendJson(res, json(failed));
            }
        });
        preflight(svr, "/api/upload/analyze-image", "POST, OPTIONS");

        bool ok = svr.listen(cfg.host, cfg.port);
        if (!ok) {
            logError("Не удалось запустить HTTPS сервер на порту " + std::to_string(cfg.port));
            return 1;
        }

    } catch (const std::exception& ex) {
        logError(std::string("Fatal error on startup: ") + ex.what());
        return 1;
    }

    return 0;
}
