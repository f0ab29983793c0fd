#pragma once
// ============================================================================
// TEST FRAME BUILDER
// ============================================================================
// Produces well-formed event-stream frames for tests and benchmarks.
// Raw header bytes can be appended to build deliberately malformed frames.
// ============================================================================

#include <eventwire/core/wire/constants.hpp>
#include <eventwire/core/wire/crc32.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace EventWire::Testing {

inline void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void putU32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void putU64(std::vector<uint8_t>& out, uint64_t v) {
    putU32(out, static_cast<uint32_t>(v >> 32));
    putU32(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
}

inline void setU32(std::vector<uint8_t>& out, size_t offset, uint32_t v) {
    out[offset] = static_cast<uint8_t>((v >> 24) & 0xFF);
    out[offset + 1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[offset + 2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[offset + 3] = static_cast<uint8_t>(v & 0xFF);
}

class FrameBuilder {
public:
    FrameBuilder& boolHeader(const std::string& key, bool value) {
        return addKey(key).tag(value ? HeaderType::BOOL_TRUE : HeaderType::BOOL_FALSE);
    }

    FrameBuilder& byteHeader(const std::string& key, uint8_t value) {
        addKey(key).tag(HeaderType::BYTE);
        headers_.push_back(value);
        return *this;
    }

    FrameBuilder& shortHeader(const std::string& key, uint16_t value) {
        addKey(key).tag(HeaderType::SHORT);
        putU16(headers_, value);
        return *this;
    }

    FrameBuilder& intHeader(const std::string& key, uint32_t value) {
        addKey(key).tag(HeaderType::INTEGER);
        putU32(headers_, value);
        return *this;
    }

    FrameBuilder& longHeader(const std::string& key, uint64_t value) {
        addKey(key).tag(HeaderType::LONG);
        putU64(headers_, value);
        return *this;
    }

    FrameBuilder& bytesHeader(const std::string& key, const std::vector<uint8_t>& value) {
        addKey(key).tag(HeaderType::BYTE_ARRAY);
        putU16(headers_, static_cast<uint16_t>(value.size()));
        headers_.insert(headers_.end(), value.begin(), value.end());
        return *this;
    }

    FrameBuilder& stringHeader(const std::string& key, const std::string& value) {
        addKey(key).tag(HeaderType::STRING);
        putU16(headers_, static_cast<uint16_t>(value.size()));
        headers_.insert(headers_.end(), value.begin(), value.end());
        return *this;
    }

    FrameBuilder& timestampHeader(const std::string& key, uint64_t millis) {
        addKey(key).tag(HeaderType::TIMESTAMP);
        putU64(headers_, millis);
        return *this;
    }

    FrameBuilder& uuidHeader(const std::string& key, const std::vector<uint8_t>& raw16) {
        addKey(key).tag(HeaderType::UUID);
        headers_.insert(headers_.end(), raw16.begin(), raw16.end());
        return *this;
    }

    // Raw bytes appended to the header section, e.g. an unknown type tag
    FrameBuilder& rawHeaderBytes(const std::vector<uint8_t>& bytes) {
        headers_.insert(headers_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    FrameBuilder& payload(const std::string& text) {
        payload_.assign(text.begin(), text.end());
        return *this;
    }

    // Overrides the headers_length field (checksums stay valid)
    FrameBuilder& declaredHeadersLength(uint32_t len) {
        headersLengthOverride_ = len;
        overrideHeadersLength_ = true;
        return *this;
    }

    std::vector<uint8_t> build() const {
        uint32_t total = static_cast<uint32_t>(kMinFrameLength + headers_.size() + payload_.size());
        uint32_t headersLength = overrideHeadersLength_
            ? headersLengthOverride_ : static_cast<uint32_t>(headers_.size());

        std::vector<uint8_t> frame;
        frame.reserve(total);
        putU32(frame, total);
        putU32(frame, headersLength);
        putU32(frame, computeCrc32(frame.data(), kPreludeLength));
        frame.insert(frame.end(), headers_.begin(), headers_.end());
        frame.insert(frame.end(), payload_.begin(), payload_.end());
        putU32(frame, computeCrc32(frame.data(), frame.size()));
        return frame;
    }

private:
    FrameBuilder& addKey(const std::string& key) {
        headers_.push_back(static_cast<uint8_t>(key.size()));
        headers_.insert(headers_.end(), key.begin(), key.end());
        return *this;
    }

    FrameBuilder& tag(HeaderType type) {
        headers_.push_back(static_cast<uint8_t>(type));
        return *this;
    }

    std::vector<uint8_t> headers_;
    std::vector<uint8_t> payload_;
    uint32_t headersLengthOverride_ = 0;
    bool overrideHeadersLength_ = false;
};

inline std::vector<uint8_t> minimumFrame() {
    return FrameBuilder().build();
}

inline std::vector<uint8_t> concat(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    std::vector<uint8_t> out(a);
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

} // namespace EventWire::Testing
