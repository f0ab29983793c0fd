#include <eventwire/core/decoder/frame_decoder.hpp>
#include <eventwire/core/wire/byte_order.hpp>
#include <eventwire/core/wire/constants.hpp>
#include <eventwire/core/wire/crc32.hpp>
#include <spdlog/spdlog.h>
#include <utility>


namespace EventWire {

namespace {

/**
 * Bounds-checked reader over the header section.
 * `end_` is the start of the message checksum; reads never cross it.
 */
class HeaderCursor {
public:
    HeaderCursor(const uint8_t* frame, size_t offset, size_t end)
        : frame_(frame), offset_(offset), end_(end) {}

    size_t offset() const { return offset_; }

    const uint8_t* take(size_t n) {
        if (offset_ > end_ || end_ - offset_ < n)
            throw DecodeError::truncatedHeader(offset_, n, offset_ > end_ ? 0 : end_ - offset_);
        const uint8_t* p = frame_ + offset_;
        offset_ += n;
        return p;
    }

    uint8_t u8() { return readUint8(take(1)); }
    uint16_t u16() { return readUint16BE(take(2)); }
    uint32_t u32() { return readUint32BE(take(4)); }
    uint64_t u64() { return readUint64BE(take(8)); }

    std::string text(size_t n) {
        const uint8_t* p = take(n);
        return std::string(reinterpret_cast<const char*>(p), n);
    }

private:
    const uint8_t* frame_;
    size_t offset_;
    size_t end_;
};

HeaderValue readHeaderValue(HeaderCursor& cursor) {
    size_t tagOffset = cursor.offset();
    uint8_t tag = cursor.u8();
    if (!isKnownHeaderType(tag))
        throw DecodeError::unknownHeaderType(tag, tagOffset);

    switch (static_cast<HeaderType>(tag)) {
        case HeaderType::BOOL_TRUE:
            return true;
        case HeaderType::BOOL_FALSE:
            return false;
        case HeaderType::BYTE:
            return cursor.u8();
        case HeaderType::SHORT:
            return cursor.u16();
        case HeaderType::INTEGER:
            return cursor.u32();
        case HeaderType::LONG:
            return cursor.u64();
        case HeaderType::BYTE_ARRAY: {
            uint16_t len = cursor.u16();
            const uint8_t* p = cursor.take(len);
            return Bytes(p, p + len);
        }
        case HeaderType::STRING: {
            uint16_t len = cursor.u16();
            return cursor.text(len);
        }
        case HeaderType::TIMESTAMP:
            return Timestamp{cursor.u64()};
        case HeaderType::UUID:
            return Uuid::fromBytes(cursor.take(kUuidLength));
    }
    throw DecodeError::unknownHeaderType(tag, tagOffset);
}

Payload decodePayload(std::string text, const Headers& headers) {
    auto it = headers.find(std::string(kContentTypeHeader));
    if (it == headers.end()) return Payload(std::in_place_type<std::string>, std::move(text));

    // A byte-array content type is matched on its raw bytes
    std::string contentType;
    if (const auto* str = std::get_if<std::string>(&it->second))
        contentType = *str;
    else if (const auto* raw = std::get_if<Bytes>(&it->second))
        contentType.assign(raw->begin(), raw->end());
    else
        return Payload(std::in_place_type<std::string>, std::move(text));

    if (!isJsonContentType(contentType))
        return Payload(std::in_place_type<std::string>, std::move(text));

    try {
        return Payload(std::in_place_type<nlohmann::json>, nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError::malformedPayload(e.what());
    }
}

} // anonymous namespace

ParsedMessage decodeFrame(const uint8_t* data, size_t len) {
    // The prelude plus the message checksum are required for parsing
    if (len < kMinFrameLength)
        throw DecodeError::tooShort(len);

    uint32_t totalLength = readUint32BE(data + kTotalLengthOffset);
    if (totalLength != len)
        throw DecodeError::lengthMismatch(totalLength, len);

    uint32_t headersLength = readUint32BE(data + kHeadersLengthOffset);

    uint32_t declared = readUint32BE(data + kPreludeChecksumOffset);
    uint32_t computed = computeCrc32(data, kPreludeLength);
    if (declared != computed)
        throw DecodeError::preludeChecksum(declared, computed);

    size_t bodyEnd = len - kMessageChecksumLength;
    declared = readUint32BE(data + bodyEnd);
    computed = computeCrc32(data, bodyEnd);
    if (declared != computed)
        throw DecodeError::messageChecksum(declared, computed);

    ParsedMessage msg;
    HeaderCursor cursor(data, kHeadersOffset, bodyEnd);
    const uint64_t headersEnd = static_cast<uint64_t>(kHeadersOffset) + headersLength;
    while (cursor.offset() < headersEnd) {
        uint8_t keyLength = cursor.u8();
        std::string key = cursor.text(keyLength);
        // Duplicate keys: last occurrence wins
        msg.headers.insert_or_assign(std::move(key), readHeaderValue(cursor));
    }

    // Payload starts where header parsing stopped
    size_t payloadOffset = cursor.offset();
    std::string text(reinterpret_cast<const char*>(data + payloadOffset), bodyEnd - payloadOffset);
    msg.payload = decodePayload(std::move(text), msg.headers);

    spdlog::debug("[FrameDecoder] Decoded frame: {} bytes, {} headers, {} payload bytes{}",
                  len, msg.headers.size(), bodyEnd - payloadOffset,
                  msg.isStructured() ? " (json)" : "");
    return msg;
}

ParsedMessage decodeFrame(const std::vector<uint8_t>& frame) {
    return decodeFrame(frame.data(), frame.size());
}

} // namespace EventWire
