#include <eventwire/core/stream/message_sink.hpp>
#include <algorithm>
#include <vector>

namespace EventWire {

void LoggingMessageSink::onMessage(ParsedMessage&& message) {
    ++messages_;
    spdlog::info("[Message #{}] {} headers, {} payload", messages_, message.headers.size(),
                 message.isStructured() ? "json" : "text");

    // Sorted for stable output; the header map itself is unordered
    std::vector<const Headers::value_type*> entries;
    entries.reserve(message.headers.size());
    for (const auto& entry : message.headers) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto* a, const auto* b) { return a->first < b->first; });

    for (const auto* entry : entries) {
        spdlog::info("  {} ({}) = {}", entry->first,
                     headerTypeName(headerTypeOf(entry->second)),
                     headerValueToString(entry->second));
    }

    if (message.isStructured()) {
        spdlog::info("  payload: {}", message.payloadJson().dump());
    } else {
        spdlog::info("  payload: {}", message.payloadText());
    }
}

void LoggingMessageSink::onError(const DecodeError& error) {
    spdlog::error("[Stream] {}: {}", decodeErrorCodeName(error.code()), error.what());
}

} // namespace EventWire
