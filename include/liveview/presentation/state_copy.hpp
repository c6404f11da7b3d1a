#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <liveview/session/session_machine.hpp>

namespace liveview::presentation {

struct StateCopy {
    std::string_view title;
    std::string_view description;
};

// User-facing headline and body for each session state
StateCopy copyFor(session::SessionState state) noexcept;

// The feed label, or "Screen N" for the zero-based position `index`
std::string feedDisplayLabel(const session::Feed& feed, std::size_t index);

struct Description {
    std::string title;
    std::string body;
};

// Copy for a snapshot; a recorded error replaces the state's description.
Description describe(const session::SessionSnapshot& snapshot);

} // namespace liveview::presentation
