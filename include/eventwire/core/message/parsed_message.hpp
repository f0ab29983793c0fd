#pragma once

#include <eventwire/core/message/header_value.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace EventWire {

using Headers = std::unordered_map<std::string, HeaderValue>;

/**
 * @brief Frame payload in one of its two shapes
 *
 * std::string    - raw payload text (no JSON content type declared)
 * nlohmann::json - structured value from the JSON re-decode stage
 */
using Payload = std::variant<std::string, nlohmann::json>;

/**
 * @brief Result of decoding one frame
 */
struct ParsedMessage {
    Headers headers;
    Payload payload;

    bool isStructured() const {
        return std::holds_alternative<nlohmann::json>(payload);
    }

    // Throws std::bad_variant_access when the payload has the other shape
    const std::string& payloadText() const { return std::get<std::string>(payload); }
    const nlohmann::json& payloadJson() const { return std::get<nlohmann::json>(payload); }

    /**
     * @brief Look up a header by key
     * @return Pointer to the value, or nullptr when absent
     */
    const HeaderValue* findHeader(std::string_view key) const;

    /**
     * @brief String value of a header, or nullptr when absent or not a string
     */
    const std::string* findStringHeader(std::string_view key) const;

    bool operator==(const ParsedMessage& other) const {
        return headers == other.headers && payload == other.payload;
    }
    bool operator!=(const ParsedMessage& other) const { return !(*this == other); }
};

/**
 * @brief Whether a content type selects the JSON payload stage
 *
 * Matches "application/" followed by any text containing "json", case-sensitive,
 * against the whole value.
 */
bool isJsonContentType(std::string_view contentType);

} // namespace EventWire
