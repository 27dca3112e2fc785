/**
 * @file LrcParser.hpp
 * @brief Timestamp-tagged lyric parsing.
 *
 * Turns LRC-style text into a sorted Timeline. Every "[mm:ss]" or
 * "[mm:ss.fff]" tag on a line produces one entry carrying the line's text
 * with all tags stripped. Lines without tags or without text are dropped.
 * An empty result means the text should be treated as unsynced.
 *
 * @section Dependencies
 * - std::regex
 */

#pragma once
#include <string_view>
#include "LyricTypes.hpp"

namespace lg::lyrics {

class LrcParser {
public:
    static Timeline parse(std::string_view text);

    // Whole-line ID tags such as "[ti:Night Drive]". Never touches timing.
    static LrcMetadata parseMetadata(std::string_view text);

    // Fraction digits are right-padded to milliseconds: "5" -> 500, "20" -> 200.
    static f64 tagToSeconds(std::string_view minutes,
                            std::string_view seconds,
                            std::string_view fraction);

    static std::vector<std::string_view> splitLines(std::string_view text);
    static std::string_view trim(std::string_view s);
};

} // namespace lg::lyrics
