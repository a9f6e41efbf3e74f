#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../vt/objects.hpp"

namespace vtdesigner::editor {

    // ─── Project configuration ───────────────────────────────────────────────────
    struct ProjectConfig {
        vt::VTVersion vt_version = vt::VTVersion::Version4;
        usize max_pool_history = MAX_UNDO_REDO_POOL;
        usize max_selection_history = MAX_UNDO_REDO_SELECTED;
        bool smart_naming_on_import = true;

        ProjectConfig &version(vt::VTVersion v) {
            vt_version = v;
            return *this;
        }
        ProjectConfig &pool_history(usize n) {
            max_pool_history = n;
            return *this;
        }
        ProjectConfig &selection_history(usize n) {
            max_selection_history = n;
            return *this;
        }
        ProjectConfig &smart_naming(bool enable) {
            smart_naming_on_import = enable;
            return *this;
        }
    };

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
