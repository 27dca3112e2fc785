#include "LrcParser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include "core/Logger.hpp"

namespace lg::lyrics {

namespace {

const std::regex& timeTagPattern() {
    static const std::regex pattern(R"(\[(\d{1,2}):(\d{2})(?:\.(\d{1,3}))?\])");
    return pattern;
}

const std::regex& idTagPattern() {
    static const std::regex pattern(R"(^\[([A-Za-z]{2}):(.*)\]$)");
    return pattern;
}

// Malformed digits read as zero.
int toInt(std::string_view digits) {
    int value = 0;
    auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{})
        return 0;
    return value;
}

} // namespace

std::vector<std::string_view> LrcParser::splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    usize start = 0;
    while (start <= text.size()) {
        usize end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string_view LrcParser::trim(std::string_view s) {
    auto isSpace = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

f64 LrcParser::tagToSeconds(std::string_view minutes,
                            std::string_view seconds,
                            std::string_view fraction) {
    int ms = 0;
    if (!fraction.empty()) {
        std::string padded(fraction.substr(0, 3));
        padded.resize(3, '0');
        ms = toInt(padded);
    }
    return toInt(minutes) * 60.0 + toInt(seconds) + ms / 1000.0;
}

Timeline LrcParser::parse(std::string_view text) {
    Timeline entries;
    const auto& pattern = timeTagPattern();

    for (auto lineView : splitLines(text)) {
        std::string line(lineView);

        std::vector<f64> times;
        for (std::sregex_iterator it(line.begin(), line.end(), pattern), end;
             it != end;
             ++it) {
            const auto& m = *it;
            times.push_back(tagToSeconds(m[1].str(),
                                         m[2].str(),
                                         m[3].matched ? m[3].str() : ""));
        }
        if (times.empty())
            continue;

        std::string stripped = std::regex_replace(line, pattern, "");
        std::string content(trim(stripped));
        if (content.empty())
            continue;

        for (f64 t : times)
            entries.push_back({t, content});
    }

    std::stable_sort(entries.begin(),
                     entries.end(),
                     [](const LyricEntry& a, const LyricEntry& b) {
                         return a.time < b.time;
                     });

    LOG_DEBUG("LrcParser: {} timed entries", entries.size());
    return entries;
}

LrcMetadata LrcParser::parseMetadata(std::string_view text) {
    LrcMetadata meta;
    std::smatch match;

    for (auto lineView : splitLines(text)) {
        std::string line(trim(lineView));
        if (!std::regex_match(line, match, idTagPattern()))
            continue;

        std::string tag = match[1].str();
        std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        std::string value(trim(match[2].str()));
        if (value.empty())
            continue;

        if (tag == "ti")
            meta.title = value;
        else if (tag == "ar")
            meta.artist = value;
        else if (tag == "al")
            meta.album = value;
        else if (tag == "by")
            meta.author = value;
    }
    return meta;
}

} // namespace lg::lyrics
