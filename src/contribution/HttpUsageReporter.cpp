#include "contribution/HttpUsageReporter.hpp"
#include "util/curlWrappers.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace tandem::contribution;
using namespace tandem::util;

HttpUsageReporter::HttpUsageReporter(std::string baseUrl, config::Credentials creds, const std::chrono::seconds timeout)
    : url_(std::move(baseUrl)), creds_(std::move(creds)), timeout_(timeout) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
    url_ += "/contribution/usage";
}

void HttpUsageReporter::report(const TaskReport& r) {
    nlohmann::json body = r;
    body["device_id"] = creds_.device_id;
    const auto payload = body.dump();

    SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Authorization: Bearer " + creds_.bearer_token);
    headers.add("X-Device-ID: " + creds_.device_id);

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    });

    if (!res.ok())
        throw std::runtime_error(fmt::format("Usage report for task {} failed: {}", r.task_id,
                                             res.transportFailed() ? res.error : "HTTP " + std::to_string(res.http)));
}
