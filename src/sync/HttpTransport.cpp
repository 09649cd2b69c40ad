#include "sync/Transport.hpp"
#include "sync/Errors.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace tandem::sync;
using namespace tandem::sync::model;
using namespace tandem::util;
using namespace tandem::log;

HttpTransport::HttpTransport(std::string baseUrl, config::Credentials creds, const std::chrono::seconds timeout)
    : baseUrl_(std::move(baseUrl)), creds_(std::move(creds)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

PushResponse HttpTransport::push(const PushRequest& req) {
    const auto body = post("/sync/push", nlohmann::json(req).dump());
    try {
        return nlohmann::json::parse(body).get<PushResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(fmt::format("Malformed push response: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(fmt::format("Malformed push response: {}", e.what()));
    }
}

PullResponse HttpTransport::pull(const PullRequest& req) {
    const auto body = post("/sync/pull", nlohmann::json(req).dump());
    try {
        return nlohmann::json::parse(body).get<PullResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(fmt::format("Malformed pull response: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(fmt::format("Malformed pull response: {}", e.what()));
    }
}

std::string HttpTransport::post(const std::string& path, const std::string& body) const {
    const auto url = baseUrl_ + path;

    SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Authorization: Bearer " + creds_.bearer_token);
    headers.add("X-Device-ID: " + creds_.device_id);

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 10L);
    });

    if (res.transportFailed())
        throw NetworkError(fmt::format("POST {} failed: {}", url, res.error));

    if (res.http >= 500 || res.http == 429)
        throw NetworkError(fmt::format("POST {} returned HTTP {}", url, res.http));

    if (!res.ok()) {
        Registry::sync()->error("[HttpTransport] POST {} returned HTTP {}: {}", url, res.http, res.body);
        throw ProtocolError(fmt::format("POST {} returned HTTP {}", url, res.http));
    }

    return res.body;
}
