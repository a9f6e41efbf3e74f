#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../vt/object_pool.hpp"
#include <echo/echo.hpp>

namespace vtdesigner::editor {

    // ─── Object ID allocator ─────────────────────────────────────────────────────
    // Hands out ids in [FIRST_ALLOCATED_ID, MAX_OBJECT_ID] that are not used by
    // the pool. The cursor makes consecutive allocations O(1) amortised; once it
    // runs off the end a full scan finds the first gap.
    class IdAllocator {
        u32 cursor_ = FIRST_ALLOCATED_ID;

      public:
        IdAllocator() = default;
        explicit IdAllocator(const vt::ObjectPool &pool) { resync(pool); }

        Result<ObjectID> allocate(const vt::ObjectPool &pool) {
            while (cursor_ <= MAX_OBJECT_ID) {
                auto candidate = static_cast<ObjectID>(cursor_++);
                if (!pool.contains(candidate))
                    return Result<ObjectID>::ok(candidate);
            }

            echo::category("vtdesigner.editor.ids").debug("cursor exhausted, scanning for a free id");
            for (u32 id = FIRST_ALLOCATED_ID; id <= MAX_OBJECT_ID; ++id) {
                auto candidate = static_cast<ObjectID>(id);
                if (!pool.contains(candidate)) {
                    cursor_ = id + 1;
                    return Result<ObjectID>::ok(candidate);
                }
            }

            echo::category("vtdesigner.editor.ids").error("object ID space exhausted (", pool.size(), " objects)");
            return Result<ObjectID>::err(Error::id_space_exhausted());
        }

        // Cursor = one past the highest id in use
        void resync(const vt::ObjectPool &pool) {
            auto max = pool.max_object_id();
            cursor_ = max.has_value() ? static_cast<u32>(*max) + 1 : FIRST_ALLOCATED_ID;
            if (cursor_ < FIRST_ALLOCATED_ID)
                cursor_ = FIRST_ALLOCATED_ID;
            echo::category("vtdesigner.editor.ids").trace("cursor resynced to ", cursor_);
        }

        u32 cursor() const noexcept { return cursor_; }
    };

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
