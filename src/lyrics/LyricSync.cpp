#include "LyricSync.hpp"
#include <algorithm>
#include <cmath>
#include "LineSpreader.hpp"

namespace lg::lyrics {

int LyricSync::currentIndex(f64 time, const Timeline& entries) {
    if (entries.empty() || std::isnan(time))
        return kNoLine;

    auto it = std::upper_bound(
            entries.begin(),
            entries.end(),
            time,
            [](f64 t, const LyricEntry& e) { return t < e.time; });
    return static_cast<int>(std::distance(entries.begin(), it)) - 1;
}

int LyricSync::currentIndex(f64 time, const LyricTrack& track) {
    return std::visit(
            [time](const auto& data) -> int {
                using T = std::decay_t<decltype(data)>;
                if constexpr (std::is_same_v<T, SyncedLyrics>) {
                    return currentIndex(time, data.entries);
                } else {
                    return LineSpreader::indexAt(
                            time, data.lines.size(), data.duration);
                }
            },
            track.data());
}

Neighbors LyricSync::neighbors(int index, const LyricTrack& track) {
    Neighbors out;
    if (index < 0 || static_cast<usize>(index) >= track.size())
        return out;

    const int last = static_cast<int>(track.size()) - 1;
    const int prev = std::max(0, index - 1);
    const int next = std::min(last, index + 1);
    if (prev != index)
        out.previous = track.text(prev);
    if (next != index)
        out.next = track.text(next);
    return out;
}

LyricFrame LyricSync::frame(f64 time, const LyricTrack& track) {
    LyricFrame f;
    f.index = currentIndex(time, track);
    if (f.index == kNoLine)
        return f;

    f.current = track.text(static_cast<usize>(f.index));
    auto n = neighbors(f.index, track);
    f.previous = std::move(n.previous);
    f.next = std::move(n.next);
    return f;
}

} // namespace lg::lyrics
