#pragma once

#include "../core/constants.hpp"
#include "../vt/object_pool.hpp"
#include "object_info.hpp"
#include <datapod/datapod.hpp>
#include <string>

namespace vtdesigner::editor {

    // ─── Hierarchy view ──────────────────────────────────────────────────────────
    // Depth-first flattening of the pool below the working set, the shape the
    // object tree panel draws. Unresolved references become "Missing object"
    // rows instead of errors.
    struct HierarchyNode {
        ObjectID id = NULL_OBJECT_ID;
        usize depth = 0;
        dp::String label;
        bool missing = false;
        bool has_children = false;
        bool recursion_cut = false; // already open further up this branch, or too deep
    };

    struct HierarchyView {
        bool missing_working_set = false;
        dp::Vector<HierarchyNode> nodes;

        // Ids of the nodes to expand so the first row of `target` is visible
        dp::Vector<ObjectID> path_to(ObjectID target) const {
            dp::Vector<ObjectID> path;
            for (usize i = 0; i < nodes.size(); ++i) {
                if (nodes[i].id != target || nodes[i].missing)
                    continue;
                usize depth = nodes[i].depth;
                for (usize j = i; j-- > 0 && depth > 0;) {
                    if (nodes[j].depth == depth - 1) {
                        path.insert(path.begin(), nodes[j].id);
                        depth--;
                    }
                }
                return path;
            }
            return path;
        }

        const HierarchyNode *find(ObjectID id) const {
            for (const auto &node : nodes) {
                if (node.id == id && !node.missing)
                    return &node;
            }
            return nullptr;
        }
    };

    namespace detail {
        inline void flatten(const vt::ObjectPool &pool, const ObjectInfoTable &info, const vt::VTObject &object,
                            usize depth, dp::Vector<ObjectID> &branch, HierarchyView &view) {
            HierarchyNode node;
            node.id = object.id;
            node.depth = depth;
            node.label = info.display_name(object);

            auto refs = object.referenced_objects();
            node.has_children = !refs.empty();

            bool open_on_branch = false;
            for (auto id : branch) {
                if (id == object.id) {
                    open_on_branch = true;
                    break;
                }
            }
            node.recursion_cut = node.has_children && (open_on_branch || depth >= MAX_TRAVERSAL_DEPTH);
            view.nodes.push_back(node);
            if (!node.has_children || node.recursion_cut)
                return;

            branch.push_back(object.id);
            for (auto id : refs) {
                const auto *child = pool.object_by_id(id);
                if (child) {
                    flatten(pool, info, *child, depth + 1, branch, view);
                    continue;
                }
                HierarchyNode missing;
                missing.id = id;
                missing.depth = depth + 1;
                missing.label = "Missing object: " + dp::String(std::to_string(id));
                missing.missing = true;
                view.nodes.push_back(missing);
            }
            branch.pop_back();
        }
    } // namespace detail

    inline HierarchyView build_hierarchy(const vt::ObjectPool &pool, const ObjectInfoTable &info) {
        HierarchyView view;
        const auto *working_set = pool.working_set_object();
        if (!working_set) {
            view.missing_working_set = true;
            return view;
        }
        dp::Vector<ObjectID> branch;
        detail::flatten(pool, info, *working_set, 0, branch, view);
        return view;
    }

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
