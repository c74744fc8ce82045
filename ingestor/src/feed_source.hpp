#pragma once

#include <optional>
#include <string>

// Message transport under the stream subscriber
class FeedSource {
public:
    virtual ~FeedSource() = default;

    // Throws on failure
    virtual void connect() = 0;
    virtual void send(const std::string& message) = 0;
    // Blocks until a message arrives. nullopt once the peer closed the feed,
    // throws on transport errors.
    virtual std::optional<std::string> read() = 0;
    // Safe to call from another thread to unblock a pending read
    virtual void close() = 0;
};
