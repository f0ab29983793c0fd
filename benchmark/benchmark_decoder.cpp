// ============================================================================
// BENCHMARK: FRAME DECODER & REASSEMBLER THROUGHPUT
// ============================================================================
// Scenarios:
// 1. decodeFrame on text and JSON frames
// 2. Reassembler over a pre-built stream at several chunk sizes
// ============================================================================

#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <eventwire/core/decoder/frame_decoder.hpp>
#include <eventwire/core/stream/reassembler.hpp>
#include "frame_builder.hpp"

using namespace EventWire;
using namespace EventWire::Testing;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t total_bytes;
    uint64_t elapsed_ns;
    double ns_per_op;
    double mb_per_sec;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::left << std::setw(28) << r.name
              << std::right
              << std::setw(10) << r.total_ops << " frames | "
              << std::setw(9) << std::fixed << std::setprecision(1) << r.ns_per_op << " ns/frame | "
              << std::setw(8) << std::fixed << std::setprecision(1) << r.mb_per_sec << " MB/s"
              << std::endl;
}

BenchmarkResult make_result(const std::string& name, uint64_t ops, uint64_t bytes,
                            std::chrono::steady_clock::time_point start,
                            std::chrono::steady_clock::time_point end) {
    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    if (elapsed_ns == 0) elapsed_ns = 1;
    return {name, ops, bytes, elapsed_ns, (double)elapsed_ns / ops,
            (bytes / 1e6) / (elapsed_ns / 1e9)};
}

std::vector<uint8_t> text_frame() {
    return FrameBuilder()
        .stringHeader(":message-type", "event")
        .stringHeader(":event-type", "Records")
        .stringHeader(":content-type", "application/octet-stream")
        .payload(std::string(512, 'r'))
        .build();
}

std::vector<uint8_t> json_frame() {
    return FrameBuilder()
        .stringHeader(":message-type", "event")
        .stringHeader(":event-type", "Stats")
        .stringHeader(":content-type", "application/json")
        .longHeader("bytes-scanned", 1ull << 33)
        .timestampHeader("ts", 1500000000000ull)
        .payload(R"({"Stats":{"BytesScanned":8589934592,"BytesProcessed":1024,"BytesReturned":64}})")
        .build();
}

// ============================================================================
// SCENARIOS
// ============================================================================

BenchmarkResult benchmark_decode(const std::string& name, const std::vector<uint8_t>& frame,
                                 uint64_t iterations) {
    size_t headerCount = 0;

    auto start = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < iterations; ++i) {
        ParsedMessage msg = decodeFrame(frame);
        headerCount += msg.headers.size();
    }
    auto end = std::chrono::steady_clock::now();

    volatile size_t sink = headerCount;  // Prevent optimization
    (void)sink;
    return make_result(name, iterations, iterations * frame.size(), start, end);
}

BenchmarkResult benchmark_reassembler(const std::vector<uint8_t>& stream, size_t frames,
                                      size_t chunkSize) {
    uint64_t received = 0;
    auto messageSink = std::make_shared<CallbackMessageSink>(
        [&received](ParsedMessage&&) { ++received; },
        [](const DecodeError& e) { spdlog::error("Benchmark stream failed: {}", e.what()); });
    Reassembler reassembler(messageSink);

    auto start = std::chrono::steady_clock::now();
    for (size_t off = 0; off < stream.size(); off += chunkSize) {
        reassembler.push(stream.data() + off, std::min(chunkSize, stream.size() - off));
    }
    auto end = std::chrono::steady_clock::now();

    if (received != frames) {
        spdlog::error("Expected {} frames, received {}", frames, received);
    }
    return make_result("chunk=" + std::to_string(chunkSize), frames, stream.size(), start, end);
}

void test_decode() {
    print_header("decodeFrame (200K frames each)");

    const uint64_t ITERATIONS = 200000;
    print_result(benchmark_decode("text payload (512B)", text_frame(), ITERATIONS));
    print_result(benchmark_decode("json payload", json_frame(), ITERATIONS));
}

void test_reassembler() {
    print_header("Reassembler (50K mixed frames)");

    const size_t FRAMES = 50000;
    auto text = text_frame();
    auto json = json_frame();

    std::vector<uint8_t> stream;
    stream.reserve(FRAMES / 2 * (text.size() + json.size()));
    for (size_t i = 0; i < FRAMES; ++i) {
        const auto& frame = (i % 2 == 0) ? text : json;
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    for (size_t chunk : {size_t{64}, size_t{1024}, size_t{4096}, size_t{65536}}) {
        print_result(benchmark_reassembler(stream, FRAMES, chunk));
    }
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "\nEventWire decoder benchmark" << std::endl;
    test_decode();
    test_reassembler();
    std::cout << std::endl;
    return 0;
}
