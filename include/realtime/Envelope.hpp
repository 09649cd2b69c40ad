#pragma once

#include "sync/model/Item.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace tandem::realtime {

struct ItemMsg {
    sync::model::SyncItem item;
};

struct Ack {
    std::string item_id;
    bool success{};
};

struct Heartbeat {
    int64_t timestamp{};
    std::string health = "ok";
};

struct Error {
    std::string code;
    std::string message;
    bool recoverable{true};
};

// Exactly one of the four keys is present on the wire: {"item":..}, {"ack":..}, {"heartbeat":..}, {"error":..}
using Envelope = std::variant<ItemMsg, Ack, Heartbeat, Error>;

class MalformedEnvelope : public std::runtime_error {
public:
    explicit MalformedEnvelope(const std::string& msg) : std::runtime_error(msg) {}
};

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string encode(const Envelope& env);

Envelope decode(const std::string& text);

}
