#pragma once

#include <cstdint>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace EventWire {

inline uint8_t readUint8(const uint8_t* data) {
    return *data;
}

inline uint16_t readUint16BE(const uint8_t* data) {
    uint16_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohs(v);
}

inline uint32_t readUint32BE(const uint8_t* data) {
    uint32_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohl(v);
}

inline uint64_t readUint64BE(const uint8_t* data) {
    return (static_cast<uint64_t>(readUint32BE(data)) << 32) |
           static_cast<uint64_t>(readUint32BE(data + 4));
}

} // namespace EventWire
