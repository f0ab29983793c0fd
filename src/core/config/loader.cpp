#include <eventwire/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <array>
#include <stdexcept>
#include <string_view>

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

YAML::Node requireNode(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node) {
        throw std::runtime_error("Missing required config field '" + path + "'");
    }
    return node;
}

template <typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Invalid type for config field '" + path + "': " + e.what());
    }
}

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const std::string& path, T fallback) {
    YAML::Node node = parent[key];
    if (!node) return fallback;
    return readAs<T>(node, path);
}

void loadLogging(const YAML::Node& root, AppConfig::LoggingConfig& logging) {
    YAML::Node node = root["logging"];
    if (!node) return;

    logging.level = readOptional<std::string>(node, "level", "logging.level", logging.level);
    logging.pattern = readOptional<std::string>(node, "pattern", "logging.pattern", logging.pattern);

    bool known = false;
    for (auto level : kLogLevels) {
        if (logging.level == level) known = true;
    }
    if (!known) {
        throw std::runtime_error("Invalid value for 'logging.level': " + logging.level);
    }
}

void loadReader(const YAML::Node& root, AppConfig::ReaderConfig& reader) {
    YAML::Node node = requireNode(root, "reader", "reader");

    reader.inputPath = readOptional<std::string>(node, "input_path", "reader.input_path", reader.inputPath);
    reader.chunkSize = readAs<size_t>(requireNode(node, "chunk_size", "reader.chunk_size"),
                                      "reader.chunk_size");
    reader.maxFrameLength = readOptional<uint32_t>(node, "max_frame_length",
                                                   "reader.max_frame_length", reader.maxFrameLength);

    if (reader.chunkSize == 0) {
        throw std::runtime_error("Invalid value for 'reader.chunk_size': must be greater than 0");
    }
    if (reader.inputPath.empty()) {
        throw std::runtime_error("Invalid value for 'reader.input_path': must not be empty");
    }
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }

    AppConfig::AppConfiguration config;
    config.app_name = readAs<std::string>(requireNode(root, "app_name", "app_name"), "app_name");
    config.version = readOptional<std::string>(root, "version", "version", "0.0.0");
    loadLogging(root, config.logging);
    loadReader(root, config.reader);

    spdlog::debug("[ConfigLoader] Loaded {} (chunk_size={}, max_frame_length={})",
                  filepath, config.reader.chunkSize, config.reader.maxFrameLength);
    return config;
}
