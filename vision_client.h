#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "config.h"

namespace vision {

struct VisionRequest {
    std::string imageBytes;   // сырые байты изображения
    std::string mimeType;     // image/png, image/jpeg
};

// Результат одной попытки на одном бэкенде.
struct AttemptResult {
    enum class Status {
        Ok,
        Unsupported,   // модель/запрос не поддерживается -> следующий бэкенд
        Failed         // сеть, таймаут, 5xx -> тоже следующий бэкенд
    };

    Status status;
    std::string text;      // ответ модели при Ok
    std::string detail;    // причина при ошибке
};

class VisionBackend {
public:
    virtual ~VisionBackend() = default;

    virtual std::string name() const = 0;

    // Не бросает: любые ошибки возвращаются как Failed.
    virtual AttemptResult analyze(const VisionRequest& request,
                                  std::chrono::seconds timeout) = 0;
};

using BackendList = std::vector<std::shared_ptr<VisionBackend>>;

// OpenAI-совместимый /chat/completions поверх HTTPS.
class ChatCompletionsBackend : public VisionBackend {
public:
    ChatCompletionsBackend(VisionConfig config, std::string model);

    std::string name() const override { return model_; }

    AttemptResult analyze(const VisionRequest& request,
                          std::chrono::seconds timeout) override;

private:
    VisionConfig config_;
    std::string model_;
};

struct VisionOutcome {
    enum class Status {
        Ok,
        Unavailable,   // все бэкенды перебраны
        Cancelled
    };

    Status status;
    std::string text;
    std::string backend;                 // кто ответил
    std::vector<std::string> attempts;   // "model: причина" по каждой неудаче
};

// Модели в порядке предпочтения.
const std::vector<std::string>& defaultModels();

BackendList makeDefaultBackends(const VisionConfig& config);

// Перебирает бэкенды по порядку, первый успех побеждает. Не бросает.
VisionOutcome analyzeImage(const BackendList& backends,
                           const VisionRequest& request,
                           std::chrono::seconds timeoutPerAttempt,
                           const std::atomic<bool>* cancel = nullptr);

std::future<VisionOutcome> analyzeImageAsync(BackendList backends,
                                             VisionRequest request,
                                             std::chrono::seconds timeoutPerAttempt,
                                             std::shared_ptr<std::atomic<bool>> cancel = nullptr);

// --- вынесено для тестов ---
std::string base64Encode(const std::string& data);
std::string buildPrompt();
std::string buildChatRequestBody(const std::string& model,
                                 const VisionRequest& request,
                                 int maxTokens);
AttemptResult interpretChatResponse(int httpStatus, const std::string& body);

} // namespace vision
