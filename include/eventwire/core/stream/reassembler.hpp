#pragma once

#include <eventwire/core/stream/message_sink.hpp>
#include <eventwire/core/errors/decode_error.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace EventWire {

struct ReassemblerOptions {
    // Largest total_length accepted before the frame is buffered; 0 = unlimited
    uint32_t maxFrameLength = 0;
};

struct ReassemblerStats {
    uint64_t chunksReceived = 0;
    uint64_t bytesReceived = 0;
    uint64_t framesDecoded = 0;
    uint64_t errors = 0;
};

/**
 * @class Reassembler
 * @brief Rebuilds frames from an arbitrarily chunked byte stream
 *
 * Chunks may split a frame at any offset or carry several frames. The next
 * frame's total_length is always read from the front of the accumulated
 * buffer, so chunk boundaries never need to line up with frames.
 *
 * Every complete frame is decoded with decodeFrame and handed to the sink in
 * arrival order. The first failure is delivered to MessageSink::onError and
 * ends the stream: later pushes are ignored, since frame boundaries past a
 * rejected frame cannot be trusted.
 *
 * One instance per logical stream. Not thread-safe.
 */
class Reassembler {
public:
    explicit Reassembler(MessageSinkPtr sink, ReassemblerOptions options = {});

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    /**
     * @brief Feed one chunk; emits zero or more messages synchronously
     */
    void push(const uint8_t* data, size_t len);
    void push(const std::vector<uint8_t>& chunk) { push(chunk.data(), chunk.size()); }

    /**
     * @brief Signal end of input
     * @return true if the stream ended on a frame boundary without errors.
     *         Leftover bytes are reported to the sink as IncompleteFrame.
     */
    bool finish();

    bool failed() const { return failed_; }
    size_t bufferedBytes() const { return buffer_.size(); }
    std::optional<uint32_t> expectedLength() const { return expectedLength_; }
    const ReassemblerStats& stats() const { return stats_; }

private:
    void trackNextFrame();
    void fail(const DecodeError& error);

    MessageSinkPtr sink_;
    ReassemblerOptions options_;

    std::vector<uint8_t> buffer_;
    std::optional<uint32_t> expectedLength_;
    bool failed_ = false;

    ReassemblerStats stats_;
};

} // namespace EventWire
