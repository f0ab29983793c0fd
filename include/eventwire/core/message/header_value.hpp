#pragma once

#include <eventwire/core/wire/constants.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace EventWire {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Timestamp header value: unsigned milliseconds since the Unix epoch
 */
struct Timestamp {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    uint64_t millis = 0;

    // Millisecond precision covers every count up to INT64_MAX; larger counts throw
    TimePoint toTimePoint() const {
        if (millis > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw std::out_of_range("Timestamp out of range: " + std::to_string(millis) + " ms");
        return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(millis)));
    }

    bool operator==(const Timestamp& other) const { return millis == other.millis; }
    bool operator!=(const Timestamp& other) const { return millis != other.millis; }
};

/**
 * @brief UUID header value, kept in canonical 8-4-4-4-12 lower-case hex form
 */
struct Uuid {
    std::string text;

    static Uuid fromBytes(const uint8_t* raw);
    std::array<uint8_t, kUuidLength> toBytes() const;

    bool operator==(const Uuid& other) const { return text == other.text; }
    bool operator!=(const Uuid& other) const { return text != other.text; }
};

// Alternative order is not the wire tag order: both bool tags map to `bool`.
using HeaderValue = std::variant<
    bool,
    uint8_t,
    uint16_t,
    uint32_t,
    uint64_t,
    Bytes,
    std::string,
    Timestamp,
    Uuid
>;

/**
 * @brief Wire tag a value would carry (BOOL_TRUE/BOOL_FALSE chosen by value)
 */
HeaderType headerTypeOf(const HeaderValue& value);

/**
 * @brief Render a header value for logs and the dump tool
 *
 * Bytes print as lower-case hex, timestamps as ISO-8601 UTC with milliseconds.
 */
std::string headerValueToString(const HeaderValue& value);

std::string toHex(const uint8_t* data, size_t len);

} // namespace EventWire
