#include "LyricExporter.hpp"
#include <cctype>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace lg::lyrics {

std::string LyricExporter::toText(const SongInfo& song,
                                  const LyricTrack& track) {
    std::string out;
    out += "Title: " + song.title + "\n";
    out += "Artist: " + song.artist + "\n";
    out += "\nLyrics:\n";

    auto lines = track.texts();
    for (usize i = 0; i < lines.size(); ++i) {
        if (i > 0)
            out += '\n';
        out += lines[i];
    }
    return out;
}

std::string LyricExporter::fileName(const std::string& title) {
    std::string stem;
    bool inRun = false;
    for (char c : title) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalnum(uc)) {
            stem += c;
            inRun = false;
        } else if (!inRun) {
            stem += '_';
            inRun = true;
        }
    }
    if (title.empty())
        stem = "lyrics";
    return stem + ".txt";
}

Result<std::filesystem::path> LyricExporter::write(
        const std::filesystem::path& directory,
        const SongInfo& song,
        const LyricTrack& track) {
    auto path = directory / fileName(song.title);
    if (auto res = file::writeText(path, toText(song, track)); !res)
        return Result<std::filesystem::path>::err(res.error().message);

    LOG_INFO("Exported lyrics to {}", path.string());
    return Result<std::filesystem::path>::ok(path);
}

} // namespace lg::lyrics
