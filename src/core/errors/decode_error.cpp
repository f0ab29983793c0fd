#include <eventwire/core/errors/decode_error.hpp>
#include <eventwire/core/wire/constants.hpp>
#include <spdlog/fmt/fmt.h>

namespace EventWire {

DecodeError DecodeError::tooShort(size_t actual) {
    DecodeError err(DecodeErrorCode::TooShort,
                    fmt::format("Expected a frame with at least {} bytes but got {}",
                                kMinFrameLength, actual));
    err.declared_ = kMinFrameLength;
    err.actual_ = actual;
    return err;
}

DecodeError DecodeError::lengthMismatch(uint32_t declared, size_t actual) {
    DecodeError err(DecodeErrorCode::LengthMismatch,
                    fmt::format("Expected {} bytes in the frame but got {}", declared, actual));
    err.declared_ = declared;
    err.actual_ = actual;
    return err;
}

DecodeError DecodeError::preludeChecksum(uint32_t declared, uint32_t computed) {
    return DecodeError(DecodeErrorCode::PreludeChecksumError,
                       fmt::format("Prelude checksum error (declared 0x{:08x}, computed 0x{:08x})",
                                   declared, computed));
}

DecodeError DecodeError::messageChecksum(uint32_t declared, uint32_t computed) {
    return DecodeError(DecodeErrorCode::MessageChecksumError,
                       fmt::format("Message checksum error (declared 0x{:08x}, computed 0x{:08x})",
                                   declared, computed));
}

DecodeError DecodeError::unknownHeaderType(uint8_t tag, size_t offset) {
    DecodeError err(DecodeErrorCode::UnknownHeaderType,
                    fmt::format("Unknown header value type: {} (at offset {})", tag, offset));
    err.headerType_ = tag;
    return err;
}

DecodeError DecodeError::truncatedHeader(size_t offset, size_t needed, size_t available) {
    return DecodeError(DecodeErrorCode::TruncatedHeader,
                       fmt::format("Header truncated at offset {}: needed {} bytes, {} available",
                                   offset, needed, available));
}

DecodeError DecodeError::malformedPayload(const std::string& reason) {
    return DecodeError(DecodeErrorCode::MalformedPayload,
                       fmt::format("Payload declared as JSON could not be parsed: {}", reason));
}

DecodeError DecodeError::frameTooLarge(uint32_t declared, uint32_t limit) {
    DecodeError err(DecodeErrorCode::FrameTooLarge,
                    fmt::format("Frame declares {} bytes, above the {} byte limit", declared, limit));
    err.declared_ = declared;
    err.actual_ = limit;
    return err;
}

DecodeError DecodeError::incompleteFrame(uint64_t declared, size_t buffered) {
    DecodeError err(DecodeErrorCode::IncompleteFrame,
                    declared > 0
                        ? fmt::format("Stream ended inside a frame: {} of {} bytes buffered",
                                      buffered, declared)
                        : fmt::format("Stream ended with {} bytes of an unread frame length",
                                      buffered));
    err.declared_ = declared;
    err.actual_ = buffered;
    return err;
}

} // namespace EventWire
