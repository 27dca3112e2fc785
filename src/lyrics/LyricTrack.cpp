#include "LyricTrack.hpp"
#include "LrcParser.hpp"
#include "core/Logger.hpp"
#include "util/TimeFormat.hpp"

namespace lg::lyrics {

LyricTrack LyricTrack::fromText(std::string_view raw) {
    if (LrcParser::trim(raw).empty())
        return LyricTrack();

    auto entries = LrcParser::parse(raw);
    if (!entries.empty()) {
        LOG_INFO("LyricTrack: {} synced entries", entries.size());
        return synced(std::move(entries));
    }

    std::vector<std::string> lines;
    for (auto line : LrcParser::splitLines(raw)) {
        auto trimmed = LrcParser::trim(line);
        if (!trimmed.empty())
            lines.emplace_back(trimmed);
    }
    LOG_INFO("LyricTrack: no timestamps, {} lines spread over duration",
             lines.size());
    return unsynced(std::move(lines));
}

LyricTrack LyricTrack::synced(Timeline entries) {
    if (entries.empty())
        return LyricTrack();
    return LyricTrack(SyncedLyrics{std::move(entries)});
}

LyricTrack LyricTrack::unsynced(std::vector<std::string> lines,
                                std::optional<f64> duration) {
    return LyricTrack(UnsyncedLyrics{std::move(lines), duration});
}

usize LyricTrack::size() const {
    if (auto synced = std::get_if<SyncedLyrics>(&data_))
        return synced->entries.size();
    return std::get<UnsyncedLyrics>(data_).lines.size();
}

const std::string& LyricTrack::text(usize index) const {
    if (auto synced = std::get_if<SyncedLyrics>(&data_))
        return synced->entries.at(index).text;
    return std::get<UnsyncedLyrics>(data_).lines.at(index);
}

std::vector<std::string> LyricTrack::texts() const {
    if (auto synced = std::get_if<SyncedLyrics>(&data_)) {
        std::vector<std::string> out;
        out.reserve(synced->entries.size());
        for (const auto& e : synced->entries)
            out.push_back(e.text);
        return out;
    }
    return std::get<UnsyncedLyrics>(data_).lines;
}

void LyricTrack::setDuration(std::optional<f64> duration) {
    if (auto unsynced = std::get_if<UnsyncedLyrics>(&data_))
        unsynced->duration = duration ? normalizeDuration(*duration)
                                      : std::nullopt;
}

} // namespace lg::lyrics
