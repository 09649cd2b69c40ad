#pragma once

#include <filesystem>
#include <string>

namespace tandem::config {

// Sent on every push, pull and realtime connect. Issuance happens elsewhere; we only read the token file.
struct Credentials {
    std::string device_id;
    std::string bearer_token;
};

Credentials loadCredentials(const std::string& deviceId, const std::filesystem::path& credentialFile);

}
