#pragma once
// Types.hpp - Fixed-width aliases and small value types shared everywhere

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lg {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;
using usize = std::size_t;

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    static constexpr Color white() {
        return {255, 255, 255, 255};
    }
    static constexpr Color black() {
        return {0, 0, 0, 255};
    }

    constexpr Color withAlpha(u8 alpha) const {
        return {r, g, b, alpha};
    }

    // Accepts #RGB, #RRGGBB and #RRGGBBAA. Anything else yields opaque black.
    static Color fromHex(std::string_view hex) {
        if (!hex.empty() && hex.front() == '#')
            hex.remove_prefix(1);

        auto byteAt = [&hex](usize pos, usize len, u8& out) {
            unsigned value = 0;
            auto first = hex.data() + pos;
            auto [ptr, ec] = std::from_chars(first, first + len, value, 16);
            if (ec != std::errc{} || ptr != first + len)
                return false;
            out = static_cast<u8>(len == 1 ? value * 17 : value);
            return true;
        };

        Color c;
        bool ok = false;
        if (hex.size() == 3) {
            ok = byteAt(0, 1, c.r) && byteAt(1, 1, c.g) && byteAt(2, 1, c.b);
        } else if (hex.size() == 6 || hex.size() == 8) {
            ok = byteAt(0, 2, c.r) && byteAt(2, 2, c.g) && byteAt(4, 2, c.b);
            if (ok && hex.size() == 8)
                ok = byteAt(6, 2, c.a);
        }
        return ok ? c : black();
    }

    std::string toHex() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "#";
        auto put = [&out](u8 v) {
            out += digits[v >> 4];
            out += digits[v & 0x0F];
        };
        put(r);
        put(g);
        put(b);
        if (a != 255)
            put(a);
        return out;
    }

    bool operator==(const Color&) const = default;
};

} // namespace lg
