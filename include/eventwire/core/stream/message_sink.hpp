#pragma once

#include <eventwire/core/message/parsed_message.hpp>
#include <eventwire/core/errors/decode_error.hpp>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>

namespace EventWire {

/**
 * @class MessageSink
 * @brief Emission channel of a Reassembler
 *
 * onMessage is called once per decoded frame, in arrival order.
 * onError is called at most once per stream; no messages follow it.
 * Both run synchronously inside Reassembler::push / finish.
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    virtual void onMessage(ParsedMessage&& message) = 0;
    virtual void onError(const DecodeError& error) = 0;

    virtual const char* name() const = 0;
};

using MessageSinkPtr = std::shared_ptr<MessageSink>;

/**
 * @class CallbackMessageSink
 * @brief Sink that forwards to user-provided callbacks
 */
class CallbackMessageSink : public MessageSink {
public:
    using MessageCallback = std::function<void(ParsedMessage&&)>;
    using ErrorCallback = std::function<void(const DecodeError&)>;

    CallbackMessageSink(MessageCallback onMessage, ErrorCallback onError,
                        const char* name = "CallbackMessageSink")
        : onMessage_(std::move(onMessage)), onError_(std::move(onError)), name_(name) {}

    void onMessage(ParsedMessage&& message) override {
        if (onMessage_) {
            onMessage_(std::move(message));
        }
    }

    void onError(const DecodeError& error) override {
        if (onError_) {
            onError_(error);
        }
    }

    const char* name() const override { return name_; }

private:
    MessageCallback onMessage_;
    ErrorCallback onError_;
    const char* name_;
};

/**
 * @class LoggingMessageSink
 * @brief Logs every message (headers and payload) and stream error via spdlog
 */
class LoggingMessageSink : public MessageSink {
public:
    void onMessage(ParsedMessage&& message) override;
    void onError(const DecodeError& error) override;

    const char* name() const override { return "LoggingMessageSink"; }

    uint64_t messagesLogged() const { return messages_; }

private:
    uint64_t messages_ = 0;
};

} // namespace EventWire
