#include <liveview/session/feed_registry.hpp>
#include <liveview/core/logger.hpp>

#include <algorithm>

namespace liveview::session {

namespace {

void stopTrack(const Feed& feed) {
    if (!feed.track) return;
    try {
        feed.track->stop();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Failed to stop track for feed {}: {}", feed.feed_id, e.what());
    }
}

} // namespace

bool FeedRegistry::upsert(const std::string& feed_id, webrtc::MediaTrackPtr track,
                          std::optional<std::string> label) {
    auto it = std::find_if(feeds_.begin(), feeds_.end(),
                           [&](const Feed& f) { return f.feed_id == feed_id; });
    if (it != feeds_.end()) {
        if (label) it->label = std::move(label);
        return false;
    }

    Feed feed{feed_id, std::move(label), std::move(track)};
    auto pending = pending_labels_.find(feed_id);
    if (pending != pending_labels_.end()) {
        if (!feed.label) feed.label = pending->second;
        pending_labels_.erase(pending);
    }
    feeds_.push_back(std::move(feed));
    return true;
}

bool FeedRegistry::remove(const std::string& feed_id) {
    auto it = std::find_if(feeds_.begin(), feeds_.end(),
                           [&](const Feed& f) { return f.feed_id == feed_id; });
    if (it == feeds_.end()) {
        return false;
    }
    stopTrack(*it);
    feeds_.erase(it);
    return true;
}

bool FeedRegistry::attachLabel(const std::string& feed_id, std::optional<std::string> label) {
    auto it = std::find_if(feeds_.begin(), feeds_.end(),
                           [&](const Feed& f) { return f.feed_id == feed_id; });
    if (it == feeds_.end()) {
        pending_labels_[feed_id] = std::move(label);
        return false;
    }
    it->label = std::move(label);
    return true;
}

bool FeedRegistry::contains(const std::string& feed_id) const {
    return find(feed_id) != nullptr;
}

const Feed* FeedRegistry::find(const std::string& feed_id) const {
    auto it = std::find_if(feeds_.begin(), feeds_.end(),
                           [&](const Feed& f) { return f.feed_id == feed_id; });
    return it != feeds_.end() ? &*it : nullptr;
}

std::vector<Feed> FeedRegistry::snapshot() const {
    return feeds_;
}

void FeedRegistry::clear() {
    for (const auto& feed : feeds_) {
        stopTrack(feed);
    }
    feeds_.clear();
    pending_labels_.clear();
}

} // namespace liveview::session
