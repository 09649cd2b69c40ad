#include "realtime/Envelope.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tandem::realtime {

std::string encode(const Envelope& env) {
    const json j = std::visit(overloaded{
        [](const ItemMsg& m) { return json{{"item", m.item}}; },
        [](const Ack& a) { return json{{"ack", {{"item_id", a.item_id}, {"success", a.success}}}}; },
        [](const Heartbeat& h) { return json{{"heartbeat", {{"timestamp", h.timestamp}, {"health", h.health}}}}; },
        [](const Error& e) {
            return json{{"error", {{"code", e.code}, {"message", e.message}, {"recoverable", e.recoverable}}}};
        }
    }, env);
    return j.dump();
}

Envelope decode(const std::string& text) {
    const auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw MalformedEnvelope("Envelope is not a JSON object");
    if (j.size() != 1) throw MalformedEnvelope("Envelope must carry exactly one message kind");

    try {
        if (j.contains("item")) return ItemMsg{j["item"].get<sync::model::SyncItem>()};

        if (j.contains("ack")) {
            const auto& a = j["ack"];
            return Ack{a.at("item_id").get<std::string>(), a.at("success").get<bool>()};
        }

        if (j.contains("heartbeat")) {
            const auto& h = j["heartbeat"];
            return Heartbeat{h.at("timestamp").get<int64_t>(), h.value("health", std::string("ok"))};
        }

        if (j.contains("error")) {
            const auto& e = j["error"];
            return Error{e.value("code", std::string{}), e.value("message", std::string{}), e.value("recoverable", true)};
        }
    } catch (const json::exception& e) {
        throw MalformedEnvelope(std::string("Malformed envelope body: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw MalformedEnvelope(std::string("Malformed envelope body: ") + e.what());
    }

    throw MalformedEnvelope("Unknown envelope kind: " + j.begin().key());
}

}
