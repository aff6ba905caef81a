#include "config.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

// ==================== env helpers ====================

static std::string getEnvOr(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    if (!val || !*val) return fallback;
    return std::string(val);
}

static int getEnvIntOr(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val || !*val) return fallback;

    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != std::string(val).size()) {
            throw std::invalid_argument(val);
        }
        return v;
    } catch (const std::exception&) {
        std::string msg = "Environment variable ";
        msg += name;
        msg += " must be an integer, got '";
        msg += val;
        msg += "'";
        throw std::runtime_error(msg);
    }
}

// ==================== CapacityProfile ====================

void validateCapacityProfile(const CapacityProfile& p) {
    if (p.studentsPerLab <= 0 || p.forenoonCapacity <= 0 ||
        p.afternoonCapacity < 0 || p.labsPerDay <= 0) {
        throw std::runtime_error("Capacity values out of range");
    }
    if (p.forenoonCapacity + p.afternoonCapacity != p.studentsPerLab) {
        throw std::runtime_error(
            "Forenoon (" + std::to_string(p.forenoonCapacity) +
            ") + afternoon (" + std::to_string(p.afternoonCapacity) +
            ") capacity must equal students per lab (" +
            std::to_string(p.studentsPerLab) + ")");
    }
}

// ==================== AppConfig::fromEnv ====================

AppConfig AppConfig::fromEnv() {
    AppConfig cfg;

    cfg.host     = getEnvOr("LABSCHED_HOST", cfg.host);
    cfg.port     = getEnvIntOr("LABSCHED_PORT", cfg.port);
    cfg.certPath = getEnvOr("LABSCHED_TLS_CERT", cfg.certPath);
    cfg.keyPath  = getEnvOr("LABSCHED_TLS_KEY", cfg.keyPath);

    if (cfg.port <= 0 || cfg.port > 65535) {
        throw std::runtime_error("LABSCHED_PORT out of range: " + std::to_string(cfg.port));
    }

    cfg.logging.filePath = getEnvOr("LABSCHED_LOG_FILE", cfg.logging.filePath);
    const char* level = std::getenv("LABSCHED_LOG_LEVEL");
    if (level && *level) {
        try {
            cfg.logging.minLevel = logLevelFromString(level);
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(ex.what());
        }
    }

    cfg.vision.apiKey         = getEnvOr("GROQ_API_KEY", "");
    cfg.vision.host           = getEnvOr("LABSCHED_VISION_HOST", cfg.vision.host);
    cfg.vision.path           = getEnvOr("LABSCHED_VISION_PATH", cfg.vision.path);
    cfg.vision.timeoutSeconds = getEnvIntOr("LABSCHED_VISION_TIMEOUT", cfg.vision.timeoutSeconds);
    if (cfg.vision.timeoutSeconds <= 0) {
        throw std::runtime_error("LABSCHED_VISION_TIMEOUT must be positive");
    }

    cfg.capacity.studentsPerLab    = getEnvIntOr("LABSCHED_STUDENTS_PER_LAB", cfg.capacity.studentsPerLab);
    cfg.capacity.forenoonCapacity  = getEnvIntOr("LABSCHED_FORENOON_CAPACITY", cfg.capacity.forenoonCapacity);
    cfg.capacity.afternoonCapacity = getEnvIntOr("LABSCHED_AFTERNOON_CAPACITY", cfg.capacity.afternoonCapacity);
    cfg.capacity.labsPerDay        = getEnvIntOr("LABSCHED_LABS_PER_DAY", cfg.capacity.labsPerDay);
    validateCapacityProfile(cfg.capacity);

    return cfg;
}
