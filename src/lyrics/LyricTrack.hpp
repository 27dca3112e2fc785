/**
 * @file LyricTrack.hpp
 * @brief Synced or unsynced lyric content derived from raw text.
 *
 * A LyricTrack holds exactly one of two shapes: a Timeline parsed from LRC
 * tags, or a list of plain lines spread evenly over the track duration.
 * It is rebuilt from scratch whenever the raw text changes.
 *
 * @section Dependencies
 * - LrcParser
 */

#pragma once
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include "LyricTypes.hpp"

namespace lg::lyrics {

struct SyncedLyrics {
    Timeline entries;
};

struct UnsyncedLyrics {
    std::vector<std::string> lines;
    std::optional<f64> duration;
};

class LyricTrack {
public:
    using Data = std::variant<SyncedLyrics, UnsyncedLyrics>;

    LyricTrack() = default;

    // Tagged text becomes Synced; anything else becomes Unsynced with blank
    // lines removed and the rest trimmed.
    static LyricTrack fromText(std::string_view raw);
    static LyricTrack synced(Timeline entries);
    static LyricTrack unsynced(std::vector<std::string> lines,
                               std::optional<f64> duration = std::nullopt);

    bool isSynced() const {
        return std::holds_alternative<SyncedLyrics>(data_);
    }
    bool empty() const {
        return size() == 0;
    }
    usize size() const;

    const std::string& text(usize index) const;
    // Synced: entry text in time order. Unsynced: original line order.
    std::vector<std::string> texts() const;

    // Only meaningful for unsynced lyrics; ignored otherwise.
    void setDuration(std::optional<f64> duration);

    const Data& data() const {
        return data_;
    }

private:
    explicit LyricTrack(Data data) : data_(std::move(data)) {
    }

    Data data_{UnsyncedLyrics{}};
};

} // namespace lg::lyrics
