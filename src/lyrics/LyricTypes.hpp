#pragma once
// LyricTypes.hpp - Timeline entries and the "no active line" sentinel

#include <optional>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace lg::lyrics {

// Index value meaning no line is currently active.
inline constexpr int kNoLine = -1;

struct LyricEntry {
    f64 time{0.0}; // seconds
    std::string text;

    bool operator==(const LyricEntry&) const = default;
};

// Sorted ascending by time; equal timestamps keep emission order.
using Timeline = std::vector<LyricEntry>;

// Song information carried by LRC ID tags ([ti:], [ar:], [al:], [by:])
struct LrcMetadata {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> author;
};

struct SongInfo {
    std::string title;
    std::string artist;
};

} // namespace lg::lyrics
