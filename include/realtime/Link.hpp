#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace tandem::realtime {

class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& msg) : std::runtime_error(msg) {}
};

// Message-oriented duplex transport under the realtime channel. Every call happens on
// the channel's own thread; implementations need no internal locking.
class Link {
public:
    virtual ~Link() = default;

    // Connects and authenticates. Throws LinkError.
    virtual void open() = 0;

    // Throws LinkError.
    virtual void send(const std::string& text) = 0;

    // Waits up to `timeout` for inbound frames. Returns whatever arrived, possibly nothing.
    // Throws LinkError once the connection is gone.
    virtual std::vector<std::string> poll(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
};

}
