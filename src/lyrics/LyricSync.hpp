/**
 * @file LyricSync.hpp
 * @brief Maps a playback time to the active lyric line.
 *
 * Everything here is a pure function of (time, track). Nothing is cached
 * between calls, so arbitrary seeks in either direction are always
 * answered correctly. Synced lookups binary-search the sorted timeline.
 *
 * @section Dependencies
 * - LyricTrack
 * - LineSpreader
 */

#pragma once
#include <string>
#include "LyricTrack.hpp"

namespace lg::lyrics {

struct Neighbors {
    std::string previous;
    std::string next;
};

// Everything the overlay needs for one frame
struct LyricFrame {
    int index{kNoLine};
    std::string current;
    std::string previous;
    std::string next;
};

class LyricSync {
public:
    // Index i with entries[i].time <= t < entries[i + 1].time, the last
    // entry being open-ended. kNoLine before the first timestamp.
    static int currentIndex(f64 time, const Timeline& entries);
    static int currentIndex(f64 time, const LyricTrack& track);

    // Empty text for the sentinel and at either end of the track.
    static Neighbors neighbors(int index, const LyricTrack& track);

    static LyricFrame frame(f64 time, const LyricTrack& track);
};

} // namespace lg::lyrics
