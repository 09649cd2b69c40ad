#include "config/Credentials.hpp"

#include <fstream>
#include <stdexcept>

namespace tandem::config {

Credentials loadCredentials(const std::string& deviceId, const std::filesystem::path& credentialFile) {
    std::ifstream in(credentialFile);
    if (!in) throw std::runtime_error("Unable to read credential file: " + credentialFile.string());

    std::string token;
    std::getline(in, token);
    while (!token.empty() && (token.back() == '\r' || token.back() == ' ' || token.back() == '\t')) token.pop_back();
    if (token.empty()) throw std::runtime_error("Credential file is empty: " + credentialFile.string());

    return {deviceId, token};
}

}
