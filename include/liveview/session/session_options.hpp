#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <liveview/core/config.hpp>
#include <liveview/webrtc/ice_config.hpp>

namespace liveview::session {

struct SessionOptions {
    // Bounded wait for accepted/rejected
    std::chrono::milliseconds request_timeout{20000};
    // Bounded wait from accepted until the peer connection reports connected
    std::chrono::milliseconds connection_timeout{30000};
    // When set the viewer sends a receive-only offer after "accepted" and
    // expects an answer; otherwise the agent offers.
    bool viewer_initiates_offer = false;

    std::optional<std::string> viewer_id;
    std::optional<std::string> viewer_display_name;

    webrtc::IceConfiguration ice{webrtc::defaultIceServers(), webrtc::IceTransportPolicy::All};

    // Reads the "session.*" and "ice.*" keys; missing keys keep the defaults.
    static core::Result<SessionOptions> fromConfig(const core::Config& config);
};

} // namespace liveview::session
