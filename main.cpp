#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "api_dto.h"
#include "api_json.h"
#include "config.h"
#include "logger.h"
#include "model.h"
#include "schedule_service.h"

using nlohmann::json;

// labsched_cli [--validate] [request.json]
// Без файла запрос читается из stdin, ответ печатается в stdout.
static std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main(int argc, char** argv) {
    bool validateOnly = false;
    std::string inputPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--validate") {
            validateOnly = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "usage: labsched_cli [--validate] [request.json]\n";
            return 0;
        } else {
            inputPath = arg;
        }
    }

    try {
        AppConfig cfg = AppConfig::fromEnv();
        initLogger(cfg.logging);

        std::string text;
        if (inputPath.empty()) {
            text = readAll(std::cin);
        } else {
            std::ifstream in(inputPath);
            if (!in) {
                logError("Не удалось открыть файл запроса: " + inputPath);
                return 1;
            }
            text = readAll(in);
        }

        ScheduleRequest request = json::parse(text).get<ScheduleRequest>();

        if (validateOnly) {
            ValidateResponse resp = validateSchedule(request, cfg.capacity);
            std::cout << json(resp).dump(2) << std::endl;
            return resp.success ? 0 : 2;
        }

        ApiResponse resp = generateSchedule(request, cfg.capacity);
        std::cout << buildApiResponseJsonString(resp) << std::endl;
        return resp.success ? 0 : 2;

    } catch (const json::exception& ex) {
        logError(std::string("Некорректный JSON запроса: ") + ex.what());
        return 1;
    } catch (const std::exception& ex) {
        logError(std::string("Ошибка: ") + ex.what());
        return 1;
    }
}
