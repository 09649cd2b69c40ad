#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "realtime/Envelope.hpp"
#include "realtime/Link.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tandem::realtime {

enum class ChannelState { Disconnected, Connecting, Connected, Reconnecting, GaveUp };

enum class SendResult { Delivered, Rejected, NotDelivered };

std::string to_string(ChannelState s);
std::string to_string(SendResult r);

class Channel final : public concurrency::AsyncService {
public:
    using ItemHandler = std::function<void(const sync::model::SyncItem&)>;

    Channel(std::shared_ptr<Link> link, const config::RealtimeConfig& cfg);

    ~Channel() override;

    // Inbound items from the remote. Runs on the channel thread; throwing nacks the item.
    void setItemHandler(ItemHandler handler);

    // Blocks until the remote acks or ack_timeout passes. Anything but Delivered means the
    // caller keeps the item for batch sync.
    SendResult send(const sync::model::SyncItem& item);

    // Leaves GaveUp and starts a fresh round of reconnect attempts.
    void reconnect();

    [[nodiscard]] ChannelState state() const { return state_.load(); }
    [[nodiscard]] bool usable() const { return isRunning() && state() == ChannelState::Connected; }
    [[nodiscard]] unsigned int failedAttempts() const { return failedAttempts_.load(); }

protected:
    void runLoop() override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override;

private:
    enum class AckState { Waiting, Acked, Nacked, Lost };

    std::shared_ptr<Link> link_;
    config::RealtimeConfig cfg_;

    std::atomic<ChannelState> state_{ChannelState::Disconnected};
    std::atomic<unsigned int> failedAttempts_{0};
    std::atomic<bool> reconnectRequested_{false};

    std::mutex handlerMutex_;
    ItemHandler itemHandler_;

    std::mutex ackMutex_;
    std::condition_variable ackCv_;
    std::deque<std::string> outbox_;
    std::unordered_map<std::string, AckState> awaiting_;

    std::chrono::steady_clock::time_point lastHeartbeatSent_;
    std::chrono::steady_clock::time_point lastHeartbeatSeen_;

    bool connect();
    void serviceConnection();
    void flushOutbox();
    void dispatch(const std::string& text);
    void handleItem(const sync::model::SyncItem& item);
    void dropConnection(const std::string& why);
    void failAwaiting();
};

}
