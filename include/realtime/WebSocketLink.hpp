#pragma once

#include "config/Credentials.hpp"
#include "realtime/Link.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace tandem::realtime {

// Beast websocket client for ws:// and wss:// endpoints. All async work runs on a private
// io_context that is only ever driven from inside open/send/poll/close, so the caller's
// thread owns the connection outright.
class WebSocketLink final : public Link {
public:
    WebSocketLink(std::string url, config::Credentials creds,
                  std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));

    ~WebSocketLink() override;

    void open() override;
    void send(const std::string& text) override;
    std::vector<std::string> poll(std::chrono::milliseconds timeout) override;
    void close() override;
    [[nodiscard]] bool isOpen() const override;

    struct Endpoint {
        bool secure{};
        std::string host;
        std::string port;
        std::string target;
    };

    static Endpoint parseUrl(const std::string& url);

private:
    using PlainStream  = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using SecureStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    Endpoint endpoint_;
    config::Credentials creds_;
    std::chrono::milliseconds connectTimeout_;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslCtx_;
    std::unique_ptr<PlainStream> plain_;
    std::unique_ptr<SecureStream> secure_;

    boost::beast::flat_buffer buffer_;
    std::deque<std::string> inbox_;
    boost::beast::error_code readError_;
    bool reading_{false};

    template <class Fn>
    void withStream(Fn&& fn) {
        if (secure_) fn(*secure_);
        else if (plain_) fn(*plain_);
    }

    template <class Stream>
    void handshake(Stream& ws);

    void connectLowest(boost::beast::tcp_stream& layer);
    void armRead();
    void runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout);
    void reset();
};

}
