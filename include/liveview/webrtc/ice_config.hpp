#pragma once

#include <optional>
#include <string>
#include <vector>

#include <liveview/core/config.hpp>

namespace liveview::webrtc {

// WebRTC ICE server configuration
struct IceServer {
    std::vector<std::string> urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;

    bool isTurn() const;
};

enum class IceTransportPolicy {
    All,
    Relay
};

struct IceConfiguration {
    std::vector<IceServer> servers;
    IceTransportPolicy transport_policy = IceTransportPolicy::All;

    bool hasTurn() const;
};

// Public STUN servers used when the configuration names none.
std::vector<IceServer> defaultIceServers();

// Reads "ice.servers" / "ice.relayWhenTurnAvailable" and appends the TURN
// server named by LIVEVIEW_TURN_SERVER_URL, _USERNAME and _CREDENTIAL when all
// three are set.
core::Result<IceConfiguration> iceConfigurationFromConfig(const core::Config& config);

} // namespace liveview::webrtc
