#include "vision_client.h"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "logger.h"
#include "parsers.h"

using nlohmann::json;

namespace vision {

// ---- base64 ----

std::string base64Encode(const std::string& data) {
    size_t encodedLen = 4 * ((data.size() + 2) / 3);
    std::vector<unsigned char> out(encodedLen + 1);

    int len = EVP_EncodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size())
    );
    if (len < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    return std::string(reinterpret_cast<char*>(out.data()), len);
}

// ---- запрос ----

std::string buildPrompt() {
    return
        "Analyze this image and extract ALL possible information related to an exam schedule. "
        "Use your intelligence to identify and organize the data.\n\n"
        "Extract the following if present:\n"
        "1. EXAM_NAME: Name of the exam/test\n"
        "2. DEPARTMENT: Department or branch name\n"
        "3. SEMESTER: Semester (e.g., S1, S2, S3, S4, S5, S6, S7, S8)\n"
        "4. BATCH: Batch/Division (e.g., A, B, C)\n"
        "5. ACADEMIC_YEAR: Academic year (e.g., 2024-25)\n"
        "6. DATES: Any exam dates mentioned (format: DD-MM-YY)\n"
        "7. LABS: Lab names or room numbers\n"
        "8. INTERNAL_EXAMINERS: Names and IDs of internal examiners\n"
        "9. EXTERNAL_EXAMINERS: Names and IDs of external examiners\n"
        "10. REGISTER_NUMBERS: Student register numbers (patterns like TVE20CS001, ABC21EC123)\n"
        "11. SUBJECTS: Subject names\n"
        "12. TIME_SLOTS: Time slots mentioned\n\n"
        "Output in this exact format (leave blank if not found):\n"
        "EXAM_NAME: [exam name]\n"
        "DEPARTMENT: [department]\n"
        "SEMESTER: [semester]\n"
        "BATCH: [batch]\n"
        "ACADEMIC_YEAR: [year]\n"
        "DATES:\n[list each date on new line in DD-MM-YY format]\n"
        "LABS:\n[list each lab on new line]\n"
        "INTERNAL_EXAMINERS:\n[ID: Name format, one per line]\n"
        "EXTERNAL_EXAMINERS:\n[ID: Name format, one per line]\n"
        "SUBJECTS:\n[list each subject on new line]\n"
        "REGISTER_NUMBERS:\n[list each register number on new line]\n"
        "RAW_TEXT:\n[any other text you can see that might be useful]\n\n"
        "Be thorough and extract everything you can see.";
}

std::string buildChatRequestBody(const std::string& model,
                                 const VisionRequest& request,
                                 int maxTokens) {
    std::string dataUrl = "data:" + request.mimeType + ";base64," + base64Encode(request.imageBytes);

    json body = {
        {"model", model},
        {"messages", json::array({
            {
                {"role", "user"},
                {"content", json::array({
                    {{"type", "text"}, {"text", buildPrompt()}},
                    {{"type", "image_url"}, {"image_url", {{"url", dataUrl}}}}
                })}
            }
        })},
        {"max_tokens", maxTokens}
    };
    return body.dump();
}

AttemptResult interpretChatResponse(int httpStatus, const std::string& body) {
    if (httpStatus == 200) {
        try {
            json j = json::parse(body);
            std::string content = j.at("choices").at(0).at("message").at("content").get<std::string>();
            return {AttemptResult::Status::Ok, content, ""};
        } catch (const json::exception& ex) {
            return {AttemptResult::Status::Failed, "", std::string("malformed response: ") + ex.what()};
        }
    }

    std::string detail = "HTTP " + std::to_string(httpStatus);
    if (httpStatus == 400 && toLower(body).find("model") != std::string::npos) {
        return {AttemptResult::Status::Unsupported, "", detail + " (model not available)"};
    }
    return {AttemptResult::Status::Failed, "", detail + ": " + body.substr(0, 200)};
}

// ---- ChatCompletionsBackend ----

ChatCompletionsBackend::ChatCompletionsBackend(VisionConfig config, std::string model)
    : config_(std::move(config)), model_(std::move(model)) {}

AttemptResult ChatCompletionsBackend::analyze(const VisionRequest& request,
                                              std::chrono::seconds timeout) {
    try {
        httplib::SSLClient cli(config_.host);
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);

        httplib::Headers headers = {
            {"Authorization", "Bearer " + config_.apiKey}
        };

        auto res = cli.Post(config_.path, headers,
                            buildChatRequestBody(model_, request, config_.maxTokens),
                            "application/json");
        if (!res) {
            return {AttemptResult::Status::Failed, "", "transport error: " + httplib::to_string(res.error())};
        }
        return interpretChatResponse(res->status, res->body);
    } catch (const std::exception& ex) {
        return {AttemptResult::Status::Failed, "", ex.what()};
    }
}

// ---- перебор ----

const std::vector<std::string>& defaultModels() {
    static const std::vector<std::string> models = {
        "meta-llama/llama-4-maverick-17b-128e-instruct",
        "openai/gpt-oss-120b",
        "llama-3.3-70b-versatile",
        "llama-4-scout-17b-16e-instruct",
        "llama-3.2-11b-vision-preview",
        "llama-3.2-90b-vision-preview",
    };
    return models;
}

BackendList makeDefaultBackends(const VisionConfig& config) {
    BackendList backends;
    for (const std::string& model : defaultModels()) {
        backends.push_back(std::make_shared<ChatCompletionsBackend>(config, model));
    }
    return backends;
}

VisionOutcome analyzeImage(const BackendList& backends,
                           const VisionRequest& request,
                           std::chrono::seconds timeoutPerAttempt,
                           const std::atomic<bool>* cancel) {
    VisionOutcome outcome;
    outcome.status = VisionOutcome::Status::Unavailable;

    for (const auto& backend : backends) {
        if (cancel && cancel->load()) {
            logInfo("Распознавание отменено до попытки " + backend->name());
            outcome.status = VisionOutcome::Status::Cancelled;
            return outcome;
        }

        logInfo("Распознавание: пробуем " + backend->name());
        AttemptResult r = backend->analyze(request, timeoutPerAttempt);

        if (r.status == AttemptResult::Status::Ok) {
            outcome.status  = VisionOutcome::Status::Ok;
            outcome.text    = r.text;
            outcome.backend = backend->name();
            return outcome;
        }

        // TODO: повторять Failed на том же бэкенде, если окажется, что это
        // в основном временные 5xx/таймауты, а не отсутствующая модель.
        if (r.status == AttemptResult::Status::Unsupported) {
            logWarning("Модель " + backend->name() + " недоступна, пробуем следующую");
        } else {
            logWarning("Ошибка распознавания у " + backend->name() + ": " + r.detail);
        }
        outcome.attempts.push_back(backend->name() + ": " + r.detail);
    }

    logError("Распознавание недоступно: перебрано бэкендов " + std::to_string(backends.size()));
    return outcome;
}

std::future<VisionOutcome> analyzeImageAsync(BackendList backends,
                                             VisionRequest request,
                                             std::chrono::seconds timeoutPerAttempt,
                                             std::shared_ptr<std::atomic<bool>> cancel) {
    return std::async(std::launch::async,
        [backends = std::move(backends), request = std::move(request), timeoutPerAttempt, cancel]() {
            return analyzeImage(backends, request, timeoutPerAttempt, cancel.get());
        }
    );
}

} // namespace vision
