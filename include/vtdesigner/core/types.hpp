#pragma once

#include <datapod/datapod.hpp>

namespace vtdesigner {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using ObjectID = u16;
    using StableID = u64; // process-lifetime identity of an edited object

    // ─── Pixel geometry ──────────────────────────────────────────────────────────
    struct Point {
        i16 x = 0;
        i16 y = 0;

        constexpr bool operator==(const Point &other) const noexcept { return x == other.x && y == other.y; }
    };

    struct Size {
        u16 width = 0;
        u16 height = 0;

        constexpr bool operator==(const Size &other) const noexcept {
            return width == other.width && height == other.height;
        }
    };

} // namespace vtdesigner
