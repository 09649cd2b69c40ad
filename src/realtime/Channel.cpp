#include "realtime/Channel.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

using namespace tandem::realtime;
using namespace tandem::sync::model;
using namespace tandem::log;
using namespace std::chrono;

namespace tandem::realtime {

std::string to_string(const ChannelState s) {
    switch (s) {
        case ChannelState::Disconnected: return "disconnected";
        case ChannelState::Connecting: return "connecting";
        case ChannelState::Connected: return "connected";
        case ChannelState::Reconnecting: return "reconnecting";
        case ChannelState::GaveUp: return "gave_up";
    }
    return "unknown";
}

std::string to_string(const SendResult r) {
    switch (r) {
        case SendResult::Delivered: return "delivered";
        case SendResult::Rejected: return "rejected";
        case SendResult::NotDelivered: return "not_delivered";
    }
    return "unknown";
}

}

Channel::Channel(std::shared_ptr<Link> link, const config::RealtimeConfig& cfg)
    : AsyncService("RealtimeChannel"), link_(std::move(link)), cfg_(cfg) {}

Channel::~Channel() {
    stop();
    if (link_->isOpen()) link_->close();
}

std::shared_ptr<spdlog::logger> Channel::logger() const { return Registry::realtime(); }

void Channel::setItemHandler(ItemHandler handler) {
    std::scoped_lock lock(handlerMutex_);
    itemHandler_ = std::move(handler);
}

SendResult Channel::send(const SyncItem& item) {
    if (!usable()) return SendResult::NotDelivered;

    std::unique_lock lock(ackMutex_);
    awaiting_[item.id] = AckState::Waiting;
    outbox_.push_back(encode(ItemMsg{item}));

    ackCv_.wait_for(lock, cfg_.ack_timeout, [&] { return awaiting_[item.id] != AckState::Waiting; });

    const auto outcome = awaiting_[item.id];
    awaiting_.erase(item.id);

    switch (outcome) {
        case AckState::Acked: return SendResult::Delivered;
        case AckState::Nacked:
            Registry::realtime()->warn("[Channel] Remote rejected {}", to_string(item.key()));
            return SendResult::Rejected;
        case AckState::Waiting:
        case AckState::Lost: break;
    }

    Registry::realtime()->warn("[Channel] {} not delivered within {} ms, leaving it for batch sync",
                               to_string(item.key()), cfg_.ack_timeout.count());
    return SendResult::NotDelivered;
}

void Channel::reconnect() {
    reconnectRequested_.store(true);
    wake();
}

void Channel::runLoop() {
    while (!shouldStop()) {
        if (reconnectRequested_.exchange(false)) {
            if (link_->isOpen()) link_->close();
            failedAttempts_.store(0);
            state_.store(ChannelState::Disconnected);
            Registry::realtime()->info("[Channel] Explicit reconnect requested");
        }

        if (state_.load() == ChannelState::GaveUp) {
            lazySleep(seconds(60));
            continue;
        }

        if (!link_->isOpen() && !connect()) continue;

        serviceConnection();
    }

    if (link_->isOpen()) link_->close();
    failAwaiting();
    state_.store(ChannelState::Disconnected);
}

bool Channel::connect() {
    const auto prior = state_.load();
    state_.store(prior == ChannelState::Disconnected ? ChannelState::Connecting : ChannelState::Reconnecting);

    try {
        link_->open();
    } catch (const LinkError& e) {
        const auto attempts = failedAttempts_.fetch_add(1) + 1;

        if (cfg_.reconnect.exhausted(attempts)) {
            state_.store(ChannelState::GaveUp);
            failAwaiting();
            Registry::realtime()->warn("[Channel] Giving up after {} connect attempts ({}); batch sync only until an explicit reconnect",
                                       attempts, e.what());
            return false;
        }

        const auto delay = cfg_.reconnect.delayFor(attempts - 1);
        Registry::realtime()->info("[Channel] Connect attempt {} failed: {}. Retrying in {} ms",
                                   attempts, e.what(), delay.count());
        lazySleep(delay);
        return false;
    }

    failedAttempts_.store(0);
    lastHeartbeatSeen_ = lastHeartbeatSent_ = steady_clock::now();
    state_.store(ChannelState::Connected);
    Registry::realtime()->info("[Channel] Connected");
    return true;
}

void Channel::serviceConnection() {
    try {
        flushOutbox();

        for (const auto& text : link_->poll(cfg_.poll_interval)) dispatch(text);

        const auto now = steady_clock::now();
        if (now - lastHeartbeatSent_ >= cfg_.heartbeat_interval) {
            link_->send(encode(Heartbeat{util::nowMillis(), "ok"}));
            lastHeartbeatSent_ = now;
        }

        if (now - lastHeartbeatSeen_ >= cfg_.heartbeat_interval * cfg_.missed_heartbeats) {
            dropConnection(std::to_string(cfg_.missed_heartbeats) + " heartbeats missed");
        }
    } catch (const LinkError& e) {
        dropConnection(e.what());
    }
}

void Channel::flushOutbox() {
    std::deque<std::string> pending;
    {
        std::scoped_lock lock(ackMutex_);
        pending.swap(outbox_);
    }
    for (const auto& text : pending) link_->send(text);
}

void Channel::dispatch(const std::string& text) {
    Envelope env;
    try {
        env = decode(text);
    } catch (const MalformedEnvelope& e) {
        Registry::realtime()->warn("[Channel] Dropping malformed frame: {}", e.what());
        return;
    }

    std::visit(overloaded{
        [this](const ItemMsg& m) { handleItem(m.item); },
        [this](const Ack& a) {
            std::scoped_lock lock(ackMutex_);
            if (const auto it = awaiting_.find(a.item_id); it != awaiting_.end())
                it->second = a.success ? AckState::Acked : AckState::Nacked;
            ackCv_.notify_all();
        },
        [this](const Heartbeat& h) {
            lastHeartbeatSeen_ = steady_clock::now();
            if (h.health != "ok") Registry::realtime()->debug("[Channel] Remote health: {}", h.health);
        },
        [](const Error& e) {
            if (!e.recoverable) throw LinkError("Remote error " + e.code + ": " + e.message);
            Registry::realtime()->warn("[Channel] Remote reported {}: {}", e.code, e.message);
        }
    }, env);
}

void Channel::handleItem(const SyncItem& item) {
    bool ok = item.checksumMatches();
    if (!ok) {
        Registry::realtime()->warn("[Channel] Checksum mismatch on inbound {}", to_string(item.key()));
    } else {
        std::scoped_lock lock(handlerMutex_);
        if (itemHandler_) {
            try {
                itemHandler_(item);
            } catch (const std::exception& e) {
                ok = false;
                Registry::realtime()->error("[Channel] Failed to apply inbound {}: {}", to_string(item.key()), e.what());
            }
        }
    }
    link_->send(encode(Ack{item.id, ok}));
}

void Channel::dropConnection(const std::string& why) {
    Registry::realtime()->warn("[Channel] Connection lost ({}), reconnecting", why);
    link_->close();
    failAwaiting();
    state_.store(ChannelState::Reconnecting);
}

void Channel::failAwaiting() {
    std::scoped_lock lock(ackMutex_);
    outbox_.clear();
    for (auto& [_, st] : awaiting_)
        if (st == AckState::Waiting) st = AckState::Lost;
    ackCv_.notify_all();
}
