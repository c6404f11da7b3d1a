#include <liveview/session/session_options.hpp>

namespace liveview::session {

namespace {

core::Result<std::chrono::milliseconds> readTimeout(const core::Config& config, const std::string& path,
                                                    std::chrono::milliseconds fallback) {
    if (!config.hasPath(path)) {
        return fallback;
    }
    auto value = config.getPath<int64_t>(path);
    if (!value) {
        return {core::ErrorCode::InvalidData, path + " must be an integer (milliseconds)"};
    }
    if (value.value() <= 0) {
        return {core::ErrorCode::InvalidData, path + " must be positive"};
    }
    return std::chrono::milliseconds(value.value());
}

core::Result<std::optional<std::string>> readOptionalString(const core::Config& config,
                                                            const std::string& path) {
    if (!config.hasPath(path)) {
        return std::optional<std::string>{};
    }
    auto value = config.getPath<std::string>(path);
    if (!value) {
        return {core::ErrorCode::InvalidData, path + " must be a string"};
    }
    return std::optional<std::string>{value.value()};
}

} // namespace

core::Result<SessionOptions> SessionOptions::fromConfig(const core::Config& config) {
    SessionOptions options;

    auto request_timeout = readTimeout(config, "session.requestTimeoutMs", options.request_timeout);
    if (!request_timeout) return request_timeout.error();
    options.request_timeout = request_timeout.value();

    auto connection_timeout = readTimeout(config, "session.connectionTimeoutMs", options.connection_timeout);
    if (!connection_timeout) return connection_timeout.error();
    options.connection_timeout = connection_timeout.value();

    if (config.hasPath("session.viewerInitiatesOffer")) {
        auto flag = config.getPath<bool>("session.viewerInitiatesOffer");
        if (!flag) {
            return {core::ErrorCode::InvalidData, "session.viewerInitiatesOffer must be a boolean"};
        }
        options.viewer_initiates_offer = flag.value();
    }

    auto viewer_id = readOptionalString(config, "session.viewerId");
    if (!viewer_id) return viewer_id.error();
    options.viewer_id = viewer_id.value();

    auto display_name = readOptionalString(config, "session.viewerDisplayName");
    if (!display_name) return display_name.error();
    options.viewer_display_name = display_name.value();

    auto ice = webrtc::iceConfigurationFromConfig(config);
    if (!ice) return ice.error();
    options.ice = ice.value();

    return options;
}

} // namespace liveview::session
