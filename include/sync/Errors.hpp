#pragma once

#include <stdexcept>
#include <string>

namespace tandem::sync {

// Timeout, unreachable host or a 5xx. Retried with backoff.
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& msg) : std::runtime_error(msg) {}
};

// Remote answered with something we cannot interpret. Not retried.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

// The on-disk pending queue cannot be read. Sync stays suspended until the queue is cleared.
class CorruptQueueError : public std::runtime_error {
public:
    explicit CorruptQueueError(const std::string& msg) : std::runtime_error(msg) {}
};

}
