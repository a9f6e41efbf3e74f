#pragma once

#include "types.hpp"

namespace vtdesigner {

    // ─── Object ID space (ISO 11783-6 §4.6.1) ────────────────────────────────────
    inline constexpr ObjectID NULL_OBJECT_ID = 0xFFFF;
    inline constexpr ObjectID MAX_OBJECT_ID = 0xFFFE;
    inline constexpr ObjectID FIRST_ALLOCATED_ID = 1;

    // ─── Editing history bounds ──────────────────────────────────────────────────
    inline constexpr usize MAX_UNDO_REDO_POOL = 10;
    inline constexpr usize MAX_UNDO_REDO_SELECTED = 20;

    // ─── Graph traversal ─────────────────────────────────────────────────────────
    inline constexpr usize MAX_TRAVERSAL_DEPTH = 32; // pools may contain reference cycles

    // ─── Geometry minimums (ISO 11783-6 §4.5) ────────────────────────────────────
    inline constexpr u16 MIN_MASK_SIZE = 200;
    inline constexpr u16 MIN_SOFT_KEY_WIDTH = 60;
    inline constexpr u16 MIN_SOFT_KEY_HEIGHT = 32;

    // ─── Naming ──────────────────────────────────────────────────────────────────
    inline constexpr usize MAX_NAME_LENGTH = 100;

    // ─── Project file ────────────────────────────────────────────────────────────
    inline constexpr u8 PROJECT_FILE_MAGIC[4] = {'V', 'T', 'D', 'P'};
    inline constexpr u8 PROJECT_FILE_FORMAT_VERSION = 1;

} // namespace vtdesigner
