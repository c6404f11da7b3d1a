#include <liveview/webrtc/ice_config.hpp>
#include <liveview/core/logger.hpp>

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace liveview::webrtc {

namespace {

std::vector<std::string> splitUrls(const std::string& list) {
    std::vector<std::string> urls;
    std::stringstream ss(list);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        auto first = entry.find_first_not_of(" \t");
        auto last = entry.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        urls.push_back(entry.substr(first, last - first + 1));
    }
    return urls;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

core::Result<IceServer> parseServer(const core::ConfigValue& value, size_t index) {
    const std::string where = "ice.servers[" + std::to_string(index) + "]";

    const auto* node = std::get_if<core::ConfigNodePtr>(&value);
    if (!node || !*node) {
        return {core::ErrorCode::InvalidData, where + " must be an object"};
    }

    IceServer server;
    const auto& values = (*node)->values();
    auto urls = values.find("urls");
    if (urls == values.end()) {
        return {core::ErrorCode::InvalidData, where + ".urls is required"};
    }

    if (const auto* single = std::get_if<std::string>(&urls->second)) {
        server.urls = splitUrls(*single);
    }
    else if (const auto* list = std::get_if<core::ConfigArray>(&urls->second)) {
        for (const auto& item : *list) {
            const auto* url = std::get_if<std::string>(&item.value);
            if (!url) {
                return {core::ErrorCode::InvalidData, where + ".urls entries must be strings"};
            }
            server.urls.push_back(*url);
        }
    }
    else {
        return {core::ErrorCode::InvalidData, where + ".urls must be a string or array"};
    }

    if (server.urls.empty()) {
        return {core::ErrorCode::InvalidData, where + ".urls is empty"};
    }

    if (auto username = (*node)->get<std::string>("username")) {
        server.username = username.value();
    }
    if (auto credential = (*node)->get<std::string>("credential")) {
        server.credential = credential.value();
    }
    return server;
}

} // namespace

bool IceServer::isTurn() const {
    return std::any_of(urls.begin(), urls.end(), [](const std::string& url) {
        return url.rfind("turn", 0) == 0;
    });
}

bool IceConfiguration::hasTurn() const {
    return std::any_of(servers.begin(), servers.end(),
                       [](const IceServer& s) { return s.isTurn(); });
}

std::vector<IceServer> defaultIceServers() {
    return {
        IceServer{{"stun:stun.l.google.com:19302"}, std::nullopt, std::nullopt},
        IceServer{{"stun:stun1.l.google.com:19302"}, std::nullopt, std::nullopt}
    };
}

core::Result<IceConfiguration> iceConfigurationFromConfig(const core::Config& config) {
    IceConfiguration ice;

    if (config.hasPath("ice.servers")) {
        auto servers = config.getPath<core::ConfigArray>("ice.servers");
        if (!servers) {
            return {core::ErrorCode::InvalidData, "ice.servers must be an array"};
        }
        const auto& list = servers.value();
        for (size_t i = 0; i < list.size(); ++i) {
            auto server = parseServer(list[i].value, i);
            if (!server) {
                return server.error();
            }
            ice.servers.push_back(server.value());
        }
    }
    else {
        ice.servers = defaultIceServers();
    }

    const char* turn_url = env("LIVEVIEW_TURN_SERVER_URL");
    const char* turn_username = env("LIVEVIEW_TURN_USERNAME");
    const char* turn_credential = env("LIVEVIEW_TURN_CREDENTIAL");
    if (turn_url && turn_username && turn_credential) {
        auto urls = splitUrls(turn_url);
        if (!urls.empty()) {
            core::Logger::info("Adding TURN server from environment ({} urls)", urls.size());
            ice.servers.push_back(IceServer{std::move(urls), std::string(turn_username),
                                            std::string(turn_credential)});
        }
    }

    bool relay_when_turn = true;
    if (config.hasPath("ice.relayWhenTurnAvailable")) {
        auto flag = config.getPath<bool>("ice.relayWhenTurnAvailable");
        if (!flag) {
            return {core::ErrorCode::InvalidData, "ice.relayWhenTurnAvailable must be a boolean"};
        }
        relay_when_turn = flag.value();
    }

    ice.transport_policy = (relay_when_turn && ice.hasTurn())
        ? IceTransportPolicy::Relay
        : IceTransportPolicy::All;
    return ice;
}

} // namespace liveview::webrtc
