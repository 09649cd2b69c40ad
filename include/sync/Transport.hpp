#pragma once

#include "config/Credentials.hpp"
#include "sync/model/Wire.hpp"

#include <chrono>
#include <string>

namespace tandem::sync {

// Batch push/pull to the remote service. Implementations throw NetworkError for anything
// worth retrying and ProtocolError for responses that cannot be interpreted.
class Transport {
public:
    virtual ~Transport() = default;

    virtual model::PushResponse push(const model::PushRequest& req) = 0;

    virtual model::PullResponse pull(const model::PullRequest& req) = 0;
};

class HttpTransport final : public Transport {
public:
    HttpTransport(std::string baseUrl, config::Credentials creds, std::chrono::seconds timeout);

    model::PushResponse push(const model::PushRequest& req) override;
    model::PullResponse pull(const model::PullRequest& req) override;

private:
    std::string baseUrl_;
    config::Credentials creds_;
    std::chrono::seconds timeout_;

    std::string post(const std::string& path, const std::string& body) const;
};

}
