#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <vector>

#include <eventwire/core/config/loader.hpp>
#include <eventwire/core/stream/reassembler.hpp>

// ============================================================================
// eventwire_dump: decode an event-stream byte stream from a file or stdin
//
//   eventwire_dump [config.yaml] [input]
// ============================================================================

static void setupLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);
    if (argc > 2) {
        config.reader.inputPath = argv[2];
    }
    return config;
}

struct InputFile {
    std::FILE* handle = nullptr;
    bool owned = false;

    ~InputFile() {
        if (handle && owned) std::fclose(handle);
    }
};

static bool openInput(const std::string& path, InputFile& input) {
    if (path == "-") {
        input.handle = stdin;
        return true;
    }
    input.handle = std::fopen(path.c_str(), "rb");
    if (!input.handle) {
        spdlog::error("Cannot open input {}: {}", path, std::strerror(errno));
        return false;
    }
    input.owned = true;
    return true;
}

static bool runStream(const AppConfig::ReaderConfig& reader) {
    InputFile input;
    if (!openInput(reader.inputPath, input)) return false;

    auto sink = std::make_shared<EventWire::LoggingMessageSink>();
    EventWire::ReassemblerOptions options;
    options.maxFrameLength = reader.maxFrameLength;
    EventWire::Reassembler reassembler(sink, options);

    std::vector<uint8_t> chunk(reader.chunkSize);
    while (!reassembler.failed()) {
        size_t n = std::fread(chunk.data(), 1, chunk.size(), input.handle);
        if (n > 0) {
            reassembler.push(chunk.data(), n);
        }
        if (n < chunk.size()) {
            if (std::ferror(input.handle)) {
                spdlog::error("Read error on {}", reader.inputPath);
                return false;
            }
            break;  // EOF
        }
    }

    bool clean = reassembler.finish();
    const auto& stats = reassembler.stats();
    spdlog::info("Stream {}: {} chunks, {} bytes, {} frames, {} errors",
                 clean ? "complete" : "failed",
                 stats.chunksReceived, stats.bytesReceived, stats.framesDecoded, stats.errors);
    return clean;
}

int main(int argc, char* argv[]) {
    try {
        auto config = loadConfiguration(argc, argv);
        setupLogging(config.logging);
        spdlog::info("{} v{} reading {}", config.app_name, config.version, config.reader.inputPath);

        if (!runStream(config.reader)) {
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
