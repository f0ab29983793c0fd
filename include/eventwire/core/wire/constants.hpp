#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace EventWire {

// Frame layout: [4B total_length][4B headers_length][4B prelude_crc][headers][payload][4B message_crc]
constexpr size_t kTotalLengthOffset = 0;
constexpr size_t kHeadersLengthOffset = 4;
constexpr size_t kPreludeLength = 8;            // total_length + headers_length
constexpr size_t kPreludeChecksumOffset = 8;
constexpr size_t kPreludeChecksumLength = 4;
constexpr size_t kHeadersOffset = kPreludeLength + kPreludeChecksumLength;
constexpr size_t kMessageChecksumLength = 4;
constexpr size_t kMinFrameLength = kHeadersOffset + kMessageChecksumLength;  // 16

constexpr size_t kUuidLength = 16;

constexpr std::string_view kContentTypeHeader = ":content-type";

/**
 * @brief Header value type tags as they appear on the wire
 */
enum class HeaderType : uint8_t {
    BOOL_TRUE = 0,
    BOOL_FALSE = 1,
    BYTE = 2,
    SHORT = 3,
    INTEGER = 4,
    LONG = 5,
    BYTE_ARRAY = 6,
    STRING = 7,
    TIMESTAMP = 8,
    UUID = 9
};

constexpr uint8_t kMaxHeaderType = static_cast<uint8_t>(HeaderType::UUID);

inline constexpr bool isKnownHeaderType(uint8_t tag) {
    return tag <= kMaxHeaderType;
}

inline const char* headerTypeName(HeaderType type) {
    switch (type) {
        case HeaderType::BOOL_TRUE:  return "bool_true";
        case HeaderType::BOOL_FALSE: return "bool_false";
        case HeaderType::BYTE:       return "byte";
        case HeaderType::SHORT:      return "short";
        case HeaderType::INTEGER:    return "integer";
        case HeaderType::LONG:       return "long";
        case HeaderType::BYTE_ARRAY: return "byte_array";
        case HeaderType::STRING:     return "string";
        case HeaderType::TIMESTAMP:  return "timestamp";
        case HeaderType::UUID:       return "uuid";
    }
    return "unknown";
}

} // namespace EventWire
