#include <eventwire/core/wire/crc32.hpp>
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace EventWire {

uint32_t computeCrc32(const uint8_t* data, size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);

    // zlib takes uInt lengths; feed oversized regions in slices
    constexpr size_t kMaxSlice = std::numeric_limits<uInt>::max();
    while (len > 0) {
        size_t slice = std::min(len, kMaxSlice);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(slice));
        data += slice;
        len -= slice;
    }
    return static_cast<uint32_t>(crc);
}

} // namespace EventWire
