#pragma once

#include "../core/types.hpp"
#include "../vt/object_pool.hpp"
#include "../vt/objects.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace vtdesigner::editor {

    // Monotonic for the life of the process; the editor is single-threaded
    inline StableID next_stable_id() noexcept {
        static StableID counter = 0;
        return ++counter;
    }

    // Fallback display name: "{object_id}: {object_type}"
    inline dp::String default_object_name(const vt::VTObject &object) {
        return dp::String(std::to_string(object.id)) + ": " + vt::object_type_name(object.type);
    }

    // ─── Per-object editor metadata ──────────────────────────────────────────────
    // The numeric object ID can be edited, so it cannot identify the object
    // across renumbering. unique_id() can.
    class ObjectInfo {
        StableID unique_id_ = 0;
        dp::Optional<dp::String> name_;

      public:
        explicit ObjectInfo(const vt::VTObject &object) : unique_id_(next_stable_id()) {
            echo::category("vtdesigner.editor.info").trace("object ", object.id, " -> identity ", unique_id_);
        }

        StableID unique_id() const noexcept { return unique_id_; }
        bool has_name() const noexcept { return name_.has_value(); }

        dp::String get_name(const vt::VTObject &object) const {
            if (name_.has_value())
                return *name_;
            return default_object_name(object);
        }

        // Empty names are ignored
        void set_name(dp::String name) {
            if (!name.empty())
                name_ = std::move(name);
        }

        void clear_name() { name_ = dp::nullopt; }

        bool operator==(const ObjectInfo &other) const noexcept { return unique_id_ == other.unique_id_; }
    };

    // Numeric id -> stable identity, as recorded next to a pool snapshot
    using IdentityMap = dp::Map<ObjectID, StableID>;

    // ─── Metadata side table ─────────────────────────────────────────────────────
    // Keyed by the current numeric id; migrate() moves an entry when an object is
    // renumbered so the stable identity (and its name) follows the object.
    // Entries pushed off their id are detached, not destroyed, so that
    // restore_identities() can bring them back when history returns to a pool
    // that still has them.
    class ObjectInfoTable {
        dp::Map<ObjectID, ObjectInfo> entries_;
        dp::Vector<ObjectInfo> detached_;

      public:
        ObjectInfo &get_or_create(const vt::VTObject &object) {
            auto it = entries_.find(object.id);
            if (it == entries_.end())
                it = entries_.emplace(object.id, ObjectInfo(object)).first;
            return it->second;
        }

        const ObjectInfo *find(ObjectID id) const {
            auto it = entries_.find(id);
            return it != entries_.end() ? &it->second : nullptr;
        }

        ObjectInfo *find_mut(ObjectID id) {
            auto it = entries_.find(id);
            return it != entries_.end() ? &it->second : nullptr;
        }

        dp::String display_name(const vt::VTObject &object) const {
            const auto *info = find(object.id);
            return info ? info->get_name(object) : default_object_name(object);
        }

        // Any entry already sitting on `to` belongs to an object that no longer exists
        bool migrate(ObjectID from, ObjectID to) {
            if (from == to)
                return true;
            auto it = entries_.find(from);
            if (it == entries_.end())
                return false;
            ObjectInfo info = it->second;
            entries_.erase(from);
            detach(to);
            entries_.emplace(to, std::move(info));
            echo::category("vtdesigner.editor.info").debug("metadata moved ", from, " -> ", to);
            return true;
        }

        bool erase(ObjectID id) { return entries_.erase(id) > 0; }

        // Moves the entry on `id` aside; it keeps its identity and name
        bool detach(ObjectID id) {
            auto it = entries_.find(id);
            if (it == entries_.end())
                return false;
            detached_.push_back(it->second);
            entries_.erase(id);
            return true;
        }

        void clear() {
            entries_.clear();
            detached_.clear();
        }
        usize size() const noexcept { return entries_.size(); }
        usize detached_count() const noexcept { return detached_.size(); }

        IdentityMap identities() const {
            IdentityMap out;
            for (const auto &[id, info] : entries_)
                out[id] = info.unique_id();
            return out;
        }

        // Re-key every known entry to the id `keys` gives its identity. Entries
        // the map does not mention are detached.
        void restore_identities(const IdentityMap &keys) {
            dp::Map<StableID, ObjectID> by_identity;
            for (const auto &[id, identity] : keys)
                by_identity[identity] = id;

            dp::Vector<ObjectInfo> all = std::move(detached_);
            detached_.clear();
            for (const auto &[id, info] : entries_)
                all.push_back(info);
            entries_.clear();

            for (auto &info : all) {
                auto it = by_identity.find(info.unique_id());
                if (it != by_identity.end() && entries_.find(it->second) == entries_.end())
                    entries_.emplace(it->second, std::move(info));
                else
                    detached_.push_back(std::move(info));
            }
            echo::category("vtdesigner.editor.info")
                .debug("identities restored: ", entries_.size(), " attached, ", detached_.size(), " detached");
        }

        // Custom names of objects present in `pool`, keyed by their numeric id
        dp::Map<ObjectID, dp::String> export_names(const vt::ObjectPool &pool) const {
            dp::Map<ObjectID, dp::String> names;
            for (const auto &obj : pool.objects()) {
                const auto *info = find(obj.id);
                if (info && info->has_name())
                    names[obj.id] = info->get_name(obj);
            }
            return names;
        }

        // Re-attach saved names to fresh identities; ids missing from the pool are dropped
        usize import_names(const dp::Map<ObjectID, dp::String> &names, const vt::ObjectPool &pool) {
            usize attached = 0;
            for (const auto &[id, name] : names) {
                const auto *obj = pool.object_by_id(id);
                if (!obj) {
                    echo::category("vtdesigner.editor.info").warn("name '", name, "' refers to missing object ", id);
                    continue;
                }
                get_or_create(*obj).set_name(name);
                attached++;
            }
            return attached;
        }
    };

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
