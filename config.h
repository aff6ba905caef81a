#pragma once

#include <string>

#include "logger.h"
#include "model.h"

// --- настройки клиента распознавания изображений ---
struct VisionConfig {
    std::string apiKey;                         // пусто = распознавание выключено
    std::string host = "api.groq.com";
    std::string path = "/openai/v1/chat/completions";
    int timeoutSeconds = 60;                    // на одну попытку
    int maxTokens = 8192;

    bool enabled() const { return !apiKey.empty(); }
};

// --- общий конфиг сервиса ---
struct AppConfig {
    std::string host = "127.0.0.1";
    int         port = 8443;
    std::string certPath = "server-cert.pem";
    std::string keyPath  = "server-key.pem";

    LoggerConfig    logging;
    VisionConfig    vision;
    CapacityProfile capacity;

    // Читает LABSCHED_* и GROQ_API_KEY; бросает std::runtime_error
    // на некорректных значениях.
    static AppConfig fromEnv();
};

// Проверка согласованности ёмкостей, бросает std::runtime_error.
void validateCapacityProfile(const CapacityProfile& p);
