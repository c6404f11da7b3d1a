#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <liveview/webrtc/peer_connection.hpp>

namespace liveview::session {

struct Feed {
    std::string feed_id;
    std::optional<std::string> label;
    webrtc::MediaTrackPtr track;
};

// Per-session map from feed id to Feed, kept in insertion order. Labels that
// arrive before their feed are held and applied when the feed is upserted.
class FeedRegistry {
public:
    // Returns true when a new feed was inserted. An existing feed keeps its
    // track; only the label is updated when one is given.
    bool upsert(const std::string& feed_id, webrtc::MediaTrackPtr track,
                std::optional<std::string> label = std::nullopt);

    // Stops the feed's track. Returns false if the id is unknown.
    bool remove(const std::string& feed_id);

    // Applies the label now, or buffers it until the feed arrives. Returns
    // true if it was applied immediately.
    bool attachLabel(const std::string& feed_id, std::optional<std::string> label);

    bool contains(const std::string& feed_id) const;
    const Feed* find(const std::string& feed_id) const;
    std::size_t size() const noexcept { return feeds_.size(); }
    bool empty() const noexcept { return feeds_.empty(); }
    std::size_t pendingLabels() const noexcept { return pending_labels_.size(); }

    std::vector<Feed> snapshot() const;

    // Stops every track and forgets all feeds and buffered labels.
    void clear();

private:
    std::vector<Feed> feeds_;
    std::unordered_map<std::string, std::optional<std::string>> pending_labels_;
};

} // namespace liveview::session
