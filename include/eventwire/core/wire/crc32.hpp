#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace EventWire {

/**
 * @brief CRC-32 (ISO-HDLC, reflected 0xEDB88320) as used by both frame checksums
 * @param data Start of the checksummed region
 * @param len Number of bytes to checksum
 * @return Checksum value, comparable to the big-endian field read off the wire
 */
uint32_t computeCrc32(const uint8_t* data, size_t len);

inline uint32_t computeCrc32(const std::vector<uint8_t>& data) {
    return computeCrc32(data.data(), data.size());
}

} // namespace EventWire
