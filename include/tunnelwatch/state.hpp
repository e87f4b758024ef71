#pragma once

#include "engine.hpp"
#include "registry.hpp"

#include <optional>
#include <string_view>

namespace tunnelwatch {

constexpr std::string_view STATE_HEADER = "# tunnelwatch state v1";

// Engine state carried across restarts
struct SavedState {
    PollCursor cursor;
    SessionRegistry registry;
};

// Write cursor and registry as tab-separated lines. The file is replaced
// atomically (temp file + rename).
bool save_state(std::string_view path, const PollCursor& cursor, const SessionRegistry& registry);
bool save_state(std::string_view path, const EventDerivationEngine& engine);

// Read a state file. nullopt if missing, unreadable, or not a state file.
// Unknown and malformed lines are skipped.
std::optional<SavedState> load_state(std::string_view path);

} // namespace tunnelwatch
