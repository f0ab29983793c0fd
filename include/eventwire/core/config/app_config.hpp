#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace AppConfig {

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    struct ReaderConfig {
        std::string inputPath = "-";        // "-" = stdin
        size_t chunkSize = 4096;
        uint32_t maxFrameLength = 16 * 1024 * 1024;  // 0 = unlimited
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        LoggingConfig logging;
        ReaderConfig reader;
    };

} // namespace AppConfig
