#include <gtest/gtest.h>

#include "logger.h"

int main(int argc, char** argv) {
    // без файла журнала, только ошибки в stderr
    LoggerConfig cfg;
    cfg.filePath = "";
    cfg.minLevel = LogLevel::Error;
    initLogger(cfg);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
