#pragma once
// LyricExporter.hpp - Plain-text export used for captions and sharing
//
//   Title: <title>
//   Artist: <artist>
//
//   Lyrics:
//   <line 1>
//   ...

#include <filesystem>
#include <string>
#include "LyricTrack.hpp"
#include "util/Result.hpp"

namespace lg::lyrics {

class LyricExporter {
public:
    static std::string toText(const SongInfo& song, const LyricTrack& track);

    // Title with non-alphanumeric runs collapsed to '_', or "lyrics".
    static std::string fileName(const std::string& title);

    static Result<std::filesystem::path> write(
            const std::filesystem::path& directory,
            const SongInfo& song,
            const LyricTrack& track);
};

} // namespace lg::lyrics
