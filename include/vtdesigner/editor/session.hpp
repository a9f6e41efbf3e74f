#pragma once

#include "../core/error.hpp"
#include "../util/file_io.hpp"
#include "../util/iop_parser.hpp"
#include "../util/mailbox.hpp"
#include "project.hpp"
#include "project_config.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>
#include <memory>
#include <thread>
#include <utility>

namespace vtdesigner::editor {

    enum class FileRequestReason : u8 { LoadPool, LoadProject };

    inline const char *file_request_reason_name(FileRequestReason reason) noexcept {
        switch (reason) {
        case FileRequestReason::LoadPool: return "pool";
        case FileRequestReason::LoadProject: return "project";
        }
        return "file";
    }

    // File contents travel together with the reason they were requested for
    struct FileDelivery {
        FileRequestReason reason = FileRequestReason::LoadPool;
        dp::String path;
        Result<dp::Vector<u8>> contents;
    };

    // Runs a job somewhere else; the job posts its outcome to the session mailbox
    using FileExecutor = std::function<void(std::function<void()>)>;

    inline FileExecutor detached_thread_executor() {
        return [](std::function<void()> job) { std::thread(std::move(job)).detach(); };
    }

    // What one tick did
    struct TickOutcome {
        bool file_handled = false;
        bool project_replaced = false;
        bool pool_changed = false;
        bool selection_changed = false;
    };

    // ─── Designer session ────────────────────────────────────────────────────────
    // Owns at most one open project. tick() is the only place the project is
    // replaced or committed: it picks up at most one finished file read, then
    // reconciles staged pool and selection.
    class DesignerSession {
        ProjectConfig config_;
        FileExecutor executor_;
        std::shared_ptr<util::Mailbox<FileDelivery>> mailbox_ = std::make_shared<util::Mailbox<FileDelivery>>();
        dp::Optional<EditorProject> project_;

      public:
        explicit DesignerSession(ProjectConfig config = {}, FileExecutor executor = detached_thread_executor())
            : config_(config), executor_(std::move(executor)) {}

        const ProjectConfig &config() const noexcept { return config_; }
        DesignerSession &set_smart_naming_on_import(bool enable) {
            config_.smart_naming(enable);
            return *this;
        }

        bool has_project() const noexcept { return project_.has_value(); }
        EditorProject *project() { return project_.has_value() ? &*project_ : nullptr; }
        const EditorProject *project() const { return project_.has_value() ? &*project_ : nullptr; }

        void open_project(EditorProject project) { project_ = std::move(project); }
        void close_project() { project_ = dp::nullopt; }

        // Fire and forget; the result is picked up by a later tick(). A newer
        // request's result replaces an older one that was not picked up yet.
        void request_file(FileRequestReason reason, const dp::String &path) {
            echo::category("vtdesigner.editor.session").debug("requesting ", file_request_reason_name(reason), " ", path);
            auto mailbox = mailbox_;
            executor_([mailbox, reason, path]() {
                mailbox->send(FileDelivery{reason, path, util::read_binary_file(path)});
            });
        }

        // Same hand-off as request_file for contents obtained some other way
        void deliver_file(FileRequestReason reason, dp::Vector<u8> contents) {
            mailbox_->send(FileDelivery{reason, "", Result<dp::Vector<u8>>::ok(std::move(contents))});
        }

        TickOutcome tick() {
            TickOutcome outcome;
            auto delivery = mailbox_->try_receive();
            if (delivery.has_value()) {
                outcome.file_handled = true;
                outcome.project_replaced = handle_file(*delivery);
            }
            if (project_.has_value()) {
                outcome.pool_changed = project_->update_pool();
                outcome.selection_changed = project_->update_selected();
            }
            return outcome;
        }

        // ─── Export ───────────────────────────────────────────────────────────────
        Result<void> save_pool(const dp::String &path) const {
            if (!project_.has_value())
                return Result<void>::err(Error::invalid_state("no project open"));
            auto bytes = project_->pool().as_iop();
            if (!bytes.is_ok()) {
                echo::category("vtdesigner.editor.session").error("failed to save pool: ", bytes.error().message);
                return Result<void>::err(bytes.error());
            }
            return util::IOPParser::write_iop_file(path, bytes.value());
        }

        Result<void> save_project(const dp::String &path) const {
            if (!project_.has_value())
                return Result<void>::err(Error::invalid_state("no project open"));
            auto bytes = project_->save_project();
            if (!bytes.is_ok()) {
                echo::category("vtdesigner.editor.session").error("failed to save project: ", bytes.error().message);
                return Result<void>::err(bytes.error());
            }
            return util::write_binary_file(path, bytes.value());
        }

      private:
        // A failed read or decode keeps the open project as it is
        bool handle_file(FileDelivery &delivery) {
            if (!delivery.contents.is_ok()) {
                echo::category("vtdesigner.editor.session")
                    .error("failed to read ", file_request_reason_name(delivery.reason), " ", delivery.path, ": ",
                           delivery.contents.error().message);
                return false;
            }

            auto &bytes = delivery.contents.value();
            auto loaded = delivery.reason == FileRequestReason::LoadPool ? EditorProject::from_iop(bytes, config_)
                                                                          : EditorProject::load_project(bytes, config_);
            if (!loaded.is_ok()) {
                echo::category("vtdesigner.editor.session")
                    .error("failed to load ", file_request_reason_name(delivery.reason), ": ", loaded.error().message);
                return false;
            }

            project_ = std::move(loaded.value());
            echo::category("vtdesigner.editor.session")
                .info("opened ", file_request_reason_name(delivery.reason), " with ", project_->pool().size(),
                      " objects");
            return true;
        }
    };

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
