#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../util/iop_parser.hpp"
#include "../vt/object_defaults.hpp"
#include "../vt/object_pool.hpp"
#include "../vt/relationships.hpp"
#include "id_allocator.hpp"
#include "naming.hpp"
#include "object_info.hpp"
#include "project_config.hpp"
#include "project_file.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <utility>

namespace vtdesigner::editor {

    // ─── Editor project ──────────────────────────────────────────────────────────
    // Holds a committed pool and selection plus staged copies that edits go to.
    // update_pool() / update_selected() turn staged changes into history entries,
    // normally once per tick. Names live beside the pools and are not rolled
    // back; each pool snapshot records which identity sat on which id, so undo
    // and redo put every name back on the object it belongs to.
    class EditorProject {
        struct PoolSnapshot {
            vt::ObjectPool pool;
            IdentityMap identities;
        };

        ProjectConfig config_;

        vt::ObjectPool pool_;
        vt::ObjectPool staged_pool_;
        IdentityMap committed_identities_;
        dp::Vector<PoolSnapshot> undo_pool_history_; // back is newest
        dp::Vector<PoolSnapshot> redo_pool_history_;

        vt::NullableObjectID selected_{};
        vt::NullableObjectID staged_selected_{};
        dp::Vector<vt::NullableObjectID> undo_selected_history_;
        dp::Vector<vt::NullableObjectID> redo_selected_history_;

        u16 mask_size_ = MIN_MASK_SIZE;
        Size soft_key_size_{MIN_SOFT_KEY_WIDTH, MIN_SOFT_KEY_HEIGHT};

        ObjectInfoTable info_;
        IdAllocator ids_;

        template <typename T> static void push_bounded(dp::Vector<T> &stack, T value, usize bound) {
            stack.push_back(std::move(value));
            while (stack.size() > bound)
                stack.erase(stack.begin());
        }

        // Every committed object gets an identity so snapshots can record it
        void track_identities() {
            for (const auto &obj : pool_.objects())
                info_.get_or_create(obj);
            committed_identities_ = info_.identities();
        }

        void adopt(PoolSnapshot snapshot) {
            info_.restore_identities(snapshot.identities);
            pool_ = snapshot.pool;
            // Staged is replaced too, otherwise the next commit would record the undo itself
            staged_pool_ = std::move(snapshot.pool);
            track_identities();
            ids_.resync(pool_);
        }

      public:
        EditorProject() = default;

        // Geometry is derived from the pool's masks and keys
        static EditorProject from_pool(vt::ObjectPool pool, ProjectConfig config = {}) {
            EditorProject project;
            project.config_ = config;
            auto [mask, soft_key] = pool.minimum_mask_sizes();
            project.mask_size_ = mask;
            project.soft_key_size_ = soft_key;
            project.staged_pool_ = pool;
            project.pool_ = std::move(pool);
            project.track_identities();
            project.ids_.resync(project.pool_);
            echo::category("vtdesigner.editor.project")
                .debug("project created: ", project.pool_.size(), " objects, mask ", mask, ", soft key ",
                       soft_key.width, "x", soft_key.height);
            return project;
        }

        // Imported pools get smart names unless the config turns that off
        static Result<EditorProject> from_iop(const dp::Vector<u8> &data, ProjectConfig config = {}) {
            auto pool = util::IOPParser::parse_iop_data(data, config.vt_version);
            if (!pool.is_ok()) {
                echo::category("vtdesigner.editor.project").error("import failed: ", pool.error().message);
                return Result<EditorProject>::err(pool.error());
            }
            auto project = from_pool(std::move(pool.value()), config);
            if (config.smart_naming_on_import) {
                auto named = project.apply_smart_naming_to_all();
                echo::category("vtdesigner.editor.project").info("imported pool, ", named, " objects named");
            }
            return Result<EditorProject>::ok(std::move(project));
        }

        static Result<EditorProject> load_project(const dp::Vector<u8> &data, ProjectConfig config = {}) {
            auto file = ProjectFile::from_bytes(data);
            if (!file.is_ok()) {
                echo::category("vtdesigner.editor.project").error("project load failed: ", file.error().message);
                return Result<EditorProject>::err(file.error());
            }

            auto &contents = file.value();
            auto project = from_pool(std::move(contents.object_pool), config);
            project.mask_size_ = contents.mask_size;
            project.info_.import_names(contents.object_names, project.pool_);
            if (!contents.last_selected.is_null() && project.pool_.contains(contents.last_selected.value)) {
                project.selected_ = contents.last_selected;
                project.staged_selected_ = contents.last_selected;
            }
            echo::category("vtdesigner.editor.project")
                .info("project loaded: ", project.pool_.size(), " objects, ", contents.object_names.size(), " names");
            return Result<EditorProject>::ok(std::move(project));
        }

        // Saves the committed state
        Result<dp::Vector<u8>> save_project() const {
            ProjectFile file;
            file.object_pool = pool_;
            file.object_names = info_.export_names(pool_);
            file.mask_size = mask_size_;
            file.last_selected = selected_;
            return file.to_bytes();
        }

        // ─── State access ─────────────────────────────────────────────────────────
        const vt::ObjectPool &pool() const noexcept { return pool_; }
        const vt::ObjectPool &staged_pool() const noexcept { return staged_pool_; }
        vt::NullableObjectID selected() const noexcept { return selected_; }
        vt::NullableObjectID staged_selected() const noexcept { return staged_selected_; }
        const ProjectConfig &config() const noexcept { return config_; }
        const ObjectInfoTable &object_info() const noexcept { return info_; }

        // The only way to change the staged pool. No validation happens here.
        template <typename F> decltype(auto) edit_pool(F &&fn) { return std::forward<F>(fn)(staged_pool_); }

        void stage_selected(vt::NullableObjectID id) { staged_selected_ = id; }

        // ─── Pool history ─────────────────────────────────────────────────────────
        bool update_pool() {
            if (staged_pool_ == pool_)
                return false;
            redo_pool_history_.clear();
            push_bounded(undo_pool_history_, PoolSnapshot{std::move(pool_), std::move(committed_identities_)},
                         config_.max_pool_history);
            pool_ = staged_pool_;
            track_identities();
            echo::category("vtdesigner.editor.project")
                .debug("pool committed (", pool_.size(), " objects, undo depth ", undo_pool_history_.size(), ")");
            return true;
        }

        void undo() {
            if (undo_pool_history_.empty())
                return;
            auto snapshot = std::move(undo_pool_history_.back());
            undo_pool_history_.pop_back();
            redo_pool_history_.push_back(PoolSnapshot{std::move(pool_), std::move(committed_identities_)});
            adopt(std::move(snapshot));
            echo::category("vtdesigner.editor.project").debug("undo (", undo_pool_history_.size(), " left)");
        }

        void redo() {
            if (redo_pool_history_.empty())
                return;
            auto snapshot = std::move(redo_pool_history_.back());
            redo_pool_history_.pop_back();
            push_bounded(undo_pool_history_, PoolSnapshot{std::move(pool_), std::move(committed_identities_)},
                         config_.max_pool_history);
            adopt(std::move(snapshot));
            echo::category("vtdesigner.editor.project").debug("redo (", redo_pool_history_.size(), " left)");
        }

        bool undo_available() const noexcept { return !undo_pool_history_.empty(); }
        bool redo_available() const noexcept { return !redo_pool_history_.empty(); }
        usize undo_depth() const noexcept { return undo_pool_history_.size(); }

        // ─── Selection history ────────────────────────────────────────────────────
        // Deselecting is committed but not recorded: only a move to a real object
        // pushes the previous selection.
        bool update_selected() {
            if (staged_selected_ == selected_)
                return false;
            redo_selected_history_.clear();
            if (!staged_selected_.is_null())
                push_bounded(undo_selected_history_, selected_, config_.max_selection_history);
            selected_ = staged_selected_;
            return true;
        }

        void set_previous_selected() {
            if (undo_selected_history_.empty())
                return;
            auto previous = undo_selected_history_.back();
            undo_selected_history_.pop_back();
            redo_selected_history_.push_back(selected_);
            selected_ = previous;
            staged_selected_ = previous;
        }

        void set_next_selected() {
            if (redo_selected_history_.empty())
                return;
            auto next = redo_selected_history_.back();
            redo_selected_history_.pop_back();
            push_bounded(undo_selected_history_, selected_, config_.max_selection_history);
            selected_ = next;
            staged_selected_ = next;
        }

        bool previous_selected_available() const noexcept { return !undo_selected_history_.empty(); }
        bool next_selected_available() const noexcept { return !redo_selected_history_.empty(); }
        usize selection_history_depth() const noexcept { return undo_selected_history_.size(); }

        // ─── Editor operations ────────────────────────────────────────────────────
        Result<ObjectID> allocate_object_id() { return ids_.allocate(staged_pool_); }

        // Adds a default object of `type` to the staged pool and selects it. An
        // empty name means a smart default name.
        Result<ObjectID> add_new_object(vt::ObjectType type, const dp::String &name = "") {
            if (!name.empty()) {
                auto valid = validate_name(name, NameRegistry::from_pool(staged_pool_, info_));
                if (!valid.is_ok()) {
                    echo::category("vtdesigner.editor.project").warn("new object rejected: ", valid.error().message);
                    return Result<ObjectID>::err(valid.error());
                }
            }

            auto id = allocate_object_id();
            if (!id.is_ok())
                return id;

            dp::String final_name = name.empty() ? generate_smart_name_for_new_object(type) : name;
            auto object = vt::default_object(type);
            object.id = id.value();

            auto added = staged_pool_.add(object);
            if (!added.is_ok())
                return Result<ObjectID>::err(added.error());

            // A stale entry on a reused id belongs to an object that is gone
            info_.detach(object.id);
            info_.get_or_create(object).set_name(final_name);
            staged_selected_ = vt::NullableObjectID{object.id};

            echo::category("vtdesigner.editor.project")
                .debug("added ", vt::object_type_name(type), " ", object.id, " '", final_name, "'");
            return id;
        }

        // Object-list parents get the child appended to their list, the others a
        // positioned reference at `offset`
        Result<void> attach_child(ObjectID parent_id, ObjectID child_id, Point offset = {}) {
            auto *parent = staged_pool_.object_by_id_mut(parent_id);
            if (!parent)
                return Result<void>::err(Error::object_not_found(parent_id));
            const auto *child = staged_pool_.object_by_id(child_id);
            if (!child)
                return Result<void>::err(Error::object_not_found(child_id));

            if (!vt::is_allowed_child(parent->type, child->type, config_.vt_version)) {
                echo::category("vtdesigner.editor.project")
                    .warn(vt::object_type_name(parent->type), " ", parent_id, " cannot hold ",
                          vt::object_type_name(child->type), " ", child_id);
                return Result<void>::err(Error::illegal_child(dp::String(vt::object_type_name(parent->type)) +
                                                              " cannot hold " + vt::object_type_name(child->type)));
            }

            if (vt::uses_object_list(parent->type))
                parent->add_list_item(child_id);
            else
                parent->add_child(child_id, offset.x, offset.y);
            return {};
        }

        // References held by other objects are left dangling
        Result<void> remove_object(ObjectID id) {
            if (!staged_pool_.remove(id))
                return Result<void>::err(Error::object_not_found(id));
            if (staged_selected_ == vt::NullableObjectID{id})
                staged_selected_ = vt::NullableObjectID::none();
            return {};
        }

        // An unnamed object shows its id, so the new id must not collide with a
        // name already displayed
        Result<void> change_object_id(ObjectID from, ObjectID to) {
            const auto *object = staged_pool_.object_by_id(from);
            if (object && from != to && !staged_pool_.contains(to)) {
                const auto *entry = info_.find(from);
                if (!entry || !entry->has_name()) {
                    auto renumbered = *object;
                    renumbered.id = to;
                    auto registry = NameRegistry::from_pool(staged_pool_, info_);
                    registry.remove(info_.display_name(*object));
                    auto valid = validate_name(default_object_name(renumbered), registry);
                    if (!valid.is_ok()) {
                        echo::category("vtdesigner.editor.project")
                            .warn("renumber ", from, " -> ", to, " rejected: ", valid.error().message);
                        return valid;
                    }
                }
            }

            auto changed = staged_pool_.change_id(from, to);
            if (!changed.is_ok()) {
                echo::category("vtdesigner.editor.project")
                    .warn("renumber ", from, " -> ", to, " rejected: ", changed.error().message);
                return changed;
            }
            info_.migrate(from, to);
            if (staged_selected_ == vt::NullableObjectID{from})
                staged_selected_ = vt::NullableObjectID{to};
            echo::category("vtdesigner.editor.project").debug("renumbered ", from, " -> ", to);
            return {};
        }

        Result<void> rename_object(ObjectID id, const dp::String &name) {
            const auto *object = staged_pool_.object_by_id(id);
            if (!object)
                return Result<void>::err(Error::object_not_found(id));

            auto registry = NameRegistry::from_pool(staged_pool_, info_);
            registry.remove(info_.display_name(*object));
            auto valid = validate_name(name, registry);
            if (!valid.is_ok()) {
                echo::category("vtdesigner.editor.project").warn("rename of ", id, " rejected: ", valid.error().message);
                return valid;
            }
            info_.get_or_create(*object).set_name(name);
            return {};
        }

        ObjectInfo &get_object_info(const vt::VTObject &object) { return info_.get_or_create(object); }
        dp::String display_name(const vt::VTObject &object) const { return info_.display_name(object); }

        dp::String generate_smart_name_for_new_object(vt::ObjectType type) const {
            return generate_smart_default_name(type, staged_pool_.count_of_type(type),
                                               NameRegistry::from_pool(staged_pool_, info_));
        }

        usize apply_smart_naming_to_all() {
            dp::Vector<ObjectID> ids;
            for (const auto &obj : staged_pool_.objects())
                ids.push_back(obj.id);
            return apply_smart_naming(ids);
        }

        usize apply_smart_naming(const dp::Vector<ObjectID> &ids) {
            return editor::apply_smart_naming(staged_pool_, info_, ids);
        }

        // ─── Geometry and version ─────────────────────────────────────────────────
        u16 mask_size() const noexcept { return mask_size_; }
        void set_mask_size(u16 size) { mask_size_ = size; }
        Size soft_key_size() const noexcept { return soft_key_size_; }
        void set_soft_key_size(Size size) { soft_key_size_ = size; }

        vt::VTVersion vt_version() const noexcept { return config_.vt_version; }
        void set_vt_version(vt::VTVersion version) { config_.vt_version = version; }
    };

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
