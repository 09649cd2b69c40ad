#include "sync/model/Conflict.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tandem::sync::model {

std::string to_string(const Resolution r) {
    switch (r) {
        case Resolution::Merge: return "merge";
        case Resolution::UseServer: return "use_server";
        case Resolution::UseLocal: return "use_local";
        case Resolution::LatestWins: return "latest_wins";
        case Resolution::Manual: return "manual";
    }
    return "unknown";
}

Resolution resolutionFromString(const std::string& str) {
    if (str == "merge") return Resolution::Merge;
    if (str == "use_server") return Resolution::UseServer;
    if (str == "use_local") return Resolution::UseLocal;
    if (str == "latest_wins") return Resolution::LatestWins;
    if (str == "manual") return Resolution::Manual;
    throw std::invalid_argument("Unknown resolution: " + str);
}

void to_json(nlohmann::json& j, const ConflictInfo& c) {
    j = {
        {"id", c.local_version.id},
        {"local_version", c.local_version},
        {"server_version", c.server_version},
        {"suggested_resolution", to_string(c.suggested_resolution)},
        {"detected_at", c.detected_at}
    };
}

void from_json(const nlohmann::json& j, ConflictInfo& c) {
    j.at("local_version").get_to(c.local_version);
    j.at("server_version").get_to(c.server_version);
    c.suggested_resolution = resolutionFromString(j.value("suggested_resolution", std::string("manual")));
    c.detected_at = j.value("detected_at", int64_t{0});
}

}
