#include "realtime/WebSocketLink.hpp"
#include "log/Registry.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>

namespace {
namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
using tcp           = asio::ip::tcp;
}

using namespace tandem::realtime;
using namespace tandem::log;

WebSocketLink::WebSocketLink(std::string url, config::Credentials creds, const std::chrono::milliseconds connectTimeout)
    : endpoint_(parseUrl(url)), creds_(std::move(creds)), connectTimeout_(connectTimeout),
      sslCtx_(ssl::context::tls_client) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
    buffer_.max_size(1 << 20);
}

WebSocketLink::~WebSocketLink() { close(); }

WebSocketLink::Endpoint WebSocketLink::parseUrl(const std::string& url) {
    Endpoint ep;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        ep.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        throw std::invalid_argument("Realtime URL must start with ws:// or wss://: " + url);
    }

    const auto slash = rest.find('/');
    const auto authority = rest.substr(0, slash);
    ep.target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.secure ? "443" : "80";
    }

    if (ep.host.empty() || ep.port.empty()) throw std::invalid_argument("Realtime URL has no host: " + url);
    return ep;
}

void WebSocketLink::open() {
    reset();

    try {
        if (endpoint_.secure) {
            secure_ = std::make_unique<SecureStream>(ioc_, sslCtx_);
            connectLowest(beast::get_lowest_layer(*secure_));

            if (!SSL_set_tlsext_host_name(secure_->next_layer().native_handle(), endpoint_.host.c_str()))
                throw LinkError("Failed to set TLS SNI host name for " + endpoint_.host);
            secure_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
            secure_->next_layer().handshake(ssl::stream_base::client);

            handshake(*secure_);
        } else {
            plain_ = std::make_unique<PlainStream>(ioc_);
            connectLowest(beast::get_lowest_layer(*plain_));
            handshake(*plain_);
        }
    } catch (const boost::system::system_error& e) {
        reset();
        throw LinkError("Realtime connect to " + endpoint_.host + " failed: " + e.code().message());
    } catch (const LinkError&) {
        reset();
        throw;
    }

    Registry::realtime()->debug("[WebSocketLink] Connected to {}:{}{}", endpoint_.host, endpoint_.port, endpoint_.target);
    armRead();
}

void WebSocketLink::connectLowest(beast::tcp_stream& layer) {
    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(endpoint_.host, endpoint_.port);

    auto done = std::make_shared<bool>(false);
    auto ec = std::make_shared<beast::error_code>();

    layer.expires_after(connectTimeout_);
    layer.async_connect(results, [done, ec](const beast::error_code& e, const tcp::endpoint&) {
        *ec = e;
        *done = true;
    });
    runUntil([done] { return *done; }, connectTimeout_ + std::chrono::seconds(1));
    layer.expires_never();

    if (!*done) throw LinkError("Realtime connect to " + endpoint_.host + " timed out");
    if (*ec) throw LinkError("Realtime connect to " + endpoint_.host + " failed: " + ec->message());
}

template <class Stream>
void WebSocketLink::handshake(Stream& ws) {
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([creds = creds_](websocket::request_type& req) {
        req.set(http::field::user_agent, "tandemd");
        req.set(http::field::authorization, "Bearer " + creds.bearer_token);
        req.set("X-Device-ID", creds.device_id);
    }));
    ws.handshake(endpoint_.host, endpoint_.target);
    ws.text(true);
}

void WebSocketLink::send(const std::string& text) {
    if (!isOpen()) throw LinkError("Realtime link is not open");

    auto payload = std::make_shared<std::string>(text);
    auto done = std::make_shared<bool>(false);
    auto ec = std::make_shared<beast::error_code>();

    withStream([&](auto& ws) {
        ws.async_write(asio::buffer(*payload), [payload, done, ec](const beast::error_code& e, std::size_t) {
            *ec = e;
            *done = true;
        });
    });
    runUntil([done] { return *done; }, std::chrono::seconds(10));

    if (!*done) {
        reset();
        throw LinkError("Realtime write timed out");
    }
    if (*ec) {
        const auto msg = ec->message();
        reset();
        throw LinkError("Realtime write failed: " + msg);
    }
}

std::vector<std::string> WebSocketLink::poll(const std::chrono::milliseconds timeout) {
    if (!plain_ && !secure_) throw LinkError("Realtime link is not open");

    armRead();
    runUntil([this] { return !inbox_.empty() || readError_; }, timeout);

    std::vector<std::string> out(std::make_move_iterator(inbox_.begin()), std::make_move_iterator(inbox_.end()));
    inbox_.clear();

    if (readError_ && out.empty()) {
        const auto msg = readError_ == websocket::error::closed ? std::string("closed by remote") : readError_.message();
        reset();
        throw LinkError("Realtime read failed: " + msg);
    }
    return out;
}

void WebSocketLink::close() {
    if (!plain_ && !secure_) return;

    auto done = std::make_shared<bool>(false);
    withStream([&](auto& ws) {
        if (!ws.is_open() || readError_) {
            *done = true;
            return;
        }
        ws.async_close(websocket::close_code::normal, [done](const beast::error_code&) { *done = true; });
    });
    runUntil([done] { return *done; }, std::chrono::seconds(1));
    reset();
}

bool WebSocketLink::isOpen() const {
    if (readError_) return false;
    return (plain_ && plain_->is_open()) || (secure_ && secure_->is_open());
}

void WebSocketLink::armRead() {
    if (reading_ || readError_ || (!plain_ && !secure_)) return;
    reading_ = true;

    withStream([this](auto& ws) {
        ws.async_read(buffer_, [this](const beast::error_code& ec, std::size_t) {
            reading_ = false;
            if (ec) {
                readError_ = ec;
                return;
            }
            inbox_.push_back(beast::buffers_to_string(buffer_.data()));
            buffer_.consume(buffer_.size());
            armRead();
        });
    });
}

void WebSocketLink::runUntil(const std::function<bool()>& done, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    if (ioc_.stopped()) ioc_.restart();

    while (!done()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        if (ioc_.run_one_for(deadline - now) == 0 && ioc_.stopped()) break;
    }
}

void WebSocketLink::reset() {
    if (plain_ || secure_) {
        withStream([](auto& ws) {
            beast::error_code ignored;
            beast::get_lowest_layer(ws).socket().close(ignored);
        });
        // Let the aborted handlers run while the stream still exists.
        ioc_.restart();
        ioc_.poll();
    }

    plain_.reset();
    secure_.reset();
    buffer_.clear();
    inbox_.clear();
    readError_ = {};
    reading_ = false;
    ioc_.restart();
}
