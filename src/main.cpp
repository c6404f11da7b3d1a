#include <liveview/core/config.hpp>
#include <liveview/core/logger.hpp>
#include <liveview/datachannel/rtc_peer_connection.hpp>
#include <liveview/datachannel/websocket_channel.hpp>
#include <liveview/presentation/state_copy.hpp>
#include <liveview/session/session_manager.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace liveview;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted = true;
}

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config file] <agentId>" << std::endl;
}

void applyLogLevel(const core::Config& config) {
    std::string name;
    if (const char* env = std::getenv("LIVEVIEW_LOG_LEVEL")) {
        name = env;
    }
    else if (auto configured = config.getPath<std::string>("log.level")) {
        name = configured.value();
    }
    if (name.empty()) {
        return;
    }

    if (auto level = core::parseLogLevel(name)) {
        core::Logger::setLevel(*level);
    }
    else {
        core::Logger::warn("Unknown log level '{}', keeping {}", name, core::logLevelName(core::Logger::getLevel()));
    }
}

void printSnapshot(const session::SessionSnapshot& snapshot) {
    const auto text = presentation::describe(snapshot);
    std::cout << "[" << session::sessionStateString(snapshot.state) << "] " << text.title << ": " << text.body
              << std::endl;
    for (std::size_t i = 0; i < snapshot.feeds.size(); ++i) {
        std::cout << "  " << presentation::feedDisplayLabel(snapshot.feeds[i], i) << " ("
                  << snapshot.feeds[i].feed_id << ")" << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string agent_id;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        }
        else if (agent_id.empty()) {
            agent_id = arg;
        }
        else {
            usage(argv[0]);
            return 2;
        }
    }

    core::Config config;
    if (!config_path.empty()) {
        auto loaded = config.loadFromFile(config_path);
        if (!loaded) {
            core::Logger::error("Cannot load config {}: {}", config_path, loaded.error().what());
            return 1;
        }
    }
    applyLogLevel(config);

    auto options = session::SessionOptions::fromConfig(config);
    if (!options) {
        core::Logger::error("Invalid configuration: {}", options.error().what());
        return 1;
    }

    auto url = config.getPath<std::string>("signaling.url");
    if (!url) {
        core::Logger::error("signaling.url is required");
        return 1;
    }

    auto channel = datachannel::WebSocketSignalingChannel::create(url.value());
    auto opened = channel->open();
    if (!opened) {
        core::Logger::error("{}", opened.error().what());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    int status = 0;
    {
        session::SessionManager manager(channel, datachannel::makeRtcPeerConnectionFactory(), options.value());

        session::SessionHandle handle;
        try {
            handle = manager.startSession(agent_id, printSnapshot);
        }
        catch (const core::InvalidTargetError& e) {
            core::Logger::error("{}", e.what());
            usage(argv[0]);
            return 2;
        }

        while (!g_interrupted) {
            auto snapshot = manager.snapshot(handle);
            if (snapshot && session::isTerminal(snapshot->state)) {
                status = snapshot->state == session::SessionState::Error ? 1 : 0;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_interrupted) {
            core::Logger::info("Interrupted, ending session {}", handle.session_id);
            manager.endSession(handle).wait();
        }
    }

    channel->close();
    return status;
}
