#include <eventwire/core/stream/reassembler.hpp>
#include <eventwire/core/decoder/frame_decoder.hpp>
#include <eventwire/core/wire/byte_order.hpp>
#include <stdexcept>

namespace EventWire {

namespace {
constexpr size_t kLengthPrefixSize = 4;
}

Reassembler::Reassembler(MessageSinkPtr sink, ReassemblerOptions options)
    : sink_(std::move(sink)), options_(options) {
    if (!sink_)
        throw std::invalid_argument("Reassembler requires a message sink");
    buffer_.reserve(8192);
}

void Reassembler::push(const uint8_t* data, size_t len) {
    if (failed_) {
        spdlog::warn("[Reassembler] Ignoring {} byte chunk: stream already failed", len);
        return;
    }

    stats_.chunksReceived++;
    stats_.bytesReceived += len;
    if (len > 0) {
        buffer_.insert(buffer_.end(), data, data + len);
    }

    trackNextFrame();
    while (!failed_ && expectedLength_ && buffer_.size() >= *expectedLength_) {
        const uint32_t frameLen = *expectedLength_;

        ParsedMessage message;
        try {
            message = decodeFrame(buffer_.data(), frameLen);
        } catch (const DecodeError& e) {
            fail(e);
            return;
        }

        buffer_.erase(buffer_.begin(), buffer_.begin() + frameLen);
        expectedLength_.reset();
        stats_.framesDecoded++;

        sink_->onMessage(std::move(message));
        trackNextFrame();
    }
}

bool Reassembler::finish() {
    if (failed_) return false;
    if (buffer_.empty()) return true;

    fail(DecodeError::incompleteFrame(expectedLength_.value_or(0), buffer_.size()));
    return false;
}

void Reassembler::trackNextFrame() {
    if (expectedLength_ || buffer_.size() < kLengthPrefixSize) return;

    uint32_t frameLen = readUint32BE(buffer_.data());
    if (options_.maxFrameLength > 0 && frameLen > options_.maxFrameLength) {
        fail(DecodeError::frameTooLarge(frameLen, options_.maxFrameLength));
        return;
    }
    expectedLength_ = frameLen;
}

void Reassembler::fail(const DecodeError& error) {
    failed_ = true;
    stats_.errors++;
    spdlog::error("[Reassembler] Stream failed after {} frames ({} bytes buffered): {}",
                  stats_.framesDecoded, buffer_.size(), error.what());

    buffer_.clear();
    buffer_.shrink_to_fit();
    expectedLength_.reset();

    sink_->onError(error);
}

} // namespace EventWire
