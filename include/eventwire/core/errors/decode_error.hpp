#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace EventWire {

enum class DecodeErrorCode {
    TooShort,
    LengthMismatch,
    PreludeChecksumError,
    MessageChecksumError,
    UnknownHeaderType,
    TruncatedHeader,
    MalformedPayload,
    FrameTooLarge,       // reassembler only
    IncompleteFrame      // reassembler only, raised by finish()
};

inline const char* decodeErrorCodeName(DecodeErrorCode code) {
    switch (code) {
        case DecodeErrorCode::TooShort:             return "TooShort";
        case DecodeErrorCode::LengthMismatch:       return "LengthMismatch";
        case DecodeErrorCode::PreludeChecksumError: return "PreludeChecksumError";
        case DecodeErrorCode::MessageChecksumError: return "MessageChecksumError";
        case DecodeErrorCode::UnknownHeaderType:    return "UnknownHeaderType";
        case DecodeErrorCode::TruncatedHeader:      return "TruncatedHeader";
        case DecodeErrorCode::MalformedPayload:     return "MalformedPayload";
        case DecodeErrorCode::FrameTooLarge:        return "FrameTooLarge";
        case DecodeErrorCode::IncompleteFrame:      return "IncompleteFrame";
    }
    return "Unknown";
}

/**
 * @class DecodeError
 * @brief Fatal failure of a single decode call or of a reassembled stream
 *
 * Thrown by decodeFrame() and delivered to MessageSink::onError by the
 * Reassembler. The numeric details are kept alongside the message so callers
 * can inspect the offending values directly:
 * - declaredLength()/actualLength() for TooShort, LengthMismatch,
 *   FrameTooLarge and IncompleteFrame
 * - headerType() for UnknownHeaderType
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    DecodeErrorCode code() const noexcept { return code_; }
    uint64_t declaredLength() const noexcept { return declared_; }
    uint64_t actualLength() const noexcept { return actual_; }
    uint8_t headerType() const noexcept { return headerType_; }

    static DecodeError tooShort(size_t actual);
    static DecodeError lengthMismatch(uint32_t declared, size_t actual);
    static DecodeError preludeChecksum(uint32_t declared, uint32_t computed);
    static DecodeError messageChecksum(uint32_t declared, uint32_t computed);
    static DecodeError unknownHeaderType(uint8_t tag, size_t offset);
    static DecodeError truncatedHeader(size_t offset, size_t needed, size_t available);
    static DecodeError malformedPayload(const std::string& reason);
    static DecodeError frameTooLarge(uint32_t declared, uint32_t limit);
    static DecodeError incompleteFrame(uint64_t declared, size_t buffered);

private:
    DecodeErrorCode code_;
    uint64_t declared_ = 0;
    uint64_t actual_ = 0;
    uint8_t headerType_ = 0;
};

} // namespace EventWire
