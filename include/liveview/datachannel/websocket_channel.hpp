#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <rtc/rtc.hpp>

#include <liveview/signaling/channel.hpp>

namespace liveview::datachannel {

// Signaling over a WebSocket relay. Each frame is one JSON message in the
// wire format; the relay routes by sessionId. Messages sent before the
// socket opens are queued and flushed on open.
class WebSocketSignalingChannel : public signaling::SignalingChannel,
                                  public std::enable_shared_from_this<WebSocketSignalingChannel> {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::shared_ptr<WebSocketSignalingChannel> create(std::string url);
    WebSocketSignalingChannel(Token, std::string url);
    ~WebSocketSignalingChannel() override;

    // Starts connecting; failures surface as SignalingError on later sends
    core::Result<void> open();
    void close();
    bool isOpen() const;

    core::Result<void> send(const std::string& session_id, const signaling::SignalingMessage& message) override;
    [[nodiscard]] signaling::Subscription subscribe(const std::string& session_id, Handler handler) override;

private:
    void handleOpen();
    void handleClosed();
    void handleText(const std::string& text);

    const std::string url_;
    std::shared_ptr<::rtc::WebSocket> ws_;

    // Serialises socket writes so the outbox flush cannot be overtaken
    std::mutex send_mutex_;
    mutable std::mutex mutex_;
    bool opened_ = false;
    bool closed_ = false;
    std::vector<std::string> outbox_;
    std::uint64_t next_token_ = 1;
    std::map<std::string, std::map<std::uint64_t, Handler>> handlers_;
};

} // namespace liveview::datachannel
