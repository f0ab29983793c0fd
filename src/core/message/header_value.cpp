#include <eventwire/core/message/header_value.hpp>
#include <spdlog/fmt/fmt.h>
#include <ctime>
#include <stdexcept>

namespace EventWire {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Hex digit counts of the five UUID groups
constexpr size_t kUuidGroups[] = {8, 4, 4, 4, 12};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string formatTimestamp(const Timestamp& ts) {
    std::time_t seconds = static_cast<std::time_t>(ts.millis / 1000);
    std::tm utc{};
#ifdef _WIN32
    bool converted = gmtime_s(&utc, &seconds) == 0;
#else
    bool converted = gmtime_r(&seconds, &utc) != nullptr;
#endif
    char buf[48];
    // Years outside the calendar range print as the raw count
    if (!converted || std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc) == 0)
        return fmt::format("{}ms", ts.millis);
    return fmt::format("{}.{:03}Z", buf, ts.millis % 1000);
}

} // anonymous namespace

std::string toHex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

Uuid Uuid::fromBytes(const uint8_t* raw) {
    std::string hex = toHex(raw, kUuidLength);
    Uuid uuid;
    uuid.text.reserve(hex.size() + 4);
    size_t pos = 0;
    for (size_t group : kUuidGroups) {
        if (pos > 0) uuid.text.push_back('-');
        uuid.text.append(hex, pos, group);
        pos += group;
    }
    return uuid;
}

std::array<uint8_t, kUuidLength> Uuid::toBytes() const {
    std::array<uint8_t, kUuidLength> raw{};
    size_t nibbles = 0;
    for (char c : text) {
        if (c == '-') continue;
        int v = hexValue(c);
        if (v < 0 || nibbles >= kUuidLength * 2)
            throw std::invalid_argument("Malformed UUID text: " + text);
        if (nibbles % 2 == 0)
            raw[nibbles / 2] = static_cast<uint8_t>(v << 4);
        else
            raw[nibbles / 2] |= static_cast<uint8_t>(v);
        ++nibbles;
    }
    if (nibbles != kUuidLength * 2)
        throw std::invalid_argument("Malformed UUID text: " + text);
    return raw;
}

HeaderType headerTypeOf(const HeaderValue& value) {
    switch (value.index()) {
        case 0: return std::get<bool>(value) ? HeaderType::BOOL_TRUE : HeaderType::BOOL_FALSE;
        case 1: return HeaderType::BYTE;
        case 2: return HeaderType::SHORT;
        case 3: return HeaderType::INTEGER;
        case 4: return HeaderType::LONG;
        case 5: return HeaderType::BYTE_ARRAY;
        case 6: return HeaderType::STRING;
        case 7: return HeaderType::TIMESTAMP;
        default: return HeaderType::UUID;
    }
}

std::string headerValueToString(const HeaderValue& value) {
    switch (headerTypeOf(value)) {
        case HeaderType::BOOL_TRUE:  return "true";
        case HeaderType::BOOL_FALSE: return "false";
        case HeaderType::BYTE:       return std::to_string(std::get<uint8_t>(value));
        case HeaderType::SHORT:      return std::to_string(std::get<uint16_t>(value));
        case HeaderType::INTEGER:    return std::to_string(std::get<uint32_t>(value));
        case HeaderType::LONG:       return std::to_string(std::get<uint64_t>(value));
        case HeaderType::BYTE_ARRAY: {
            const auto& bytes = std::get<Bytes>(value);
            return toHex(bytes.data(), bytes.size());
        }
        case HeaderType::STRING:     return std::get<std::string>(value);
        case HeaderType::TIMESTAMP:  return formatTimestamp(std::get<Timestamp>(value));
        case HeaderType::UUID:       return std::get<Uuid>(value).text;
    }
    return {};
}

} // namespace EventWire
