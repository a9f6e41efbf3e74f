#include <echo/echo.hpp>
#include <vtdesigner.hpp>

using namespace vtdesigner;
using namespace vtdesigner::editor;
using namespace vtdesigner::vt;

int main() {
    echo::info("=== Designer Session Demo ===");

    // Run file reads inline so the next tick sees the result
    DesignerSession session(ProjectConfig{}.pool_history(5), [](std::function<void()> job) { job(); });

    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::WorkingSet).set_field(FieldRole::ActiveMask, 2))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::DataMask));
    auto bytes = pool.as_iop();
    if (!bytes.is_ok()) {
        echo::error("encode failed: ", bytes.error().message);
        return 1;
    }
    session.deliver_file(FileRequestReason::LoadPool, bytes.value());
    session.tick();
    if (!session.has_project()) {
        echo::error("pool was not opened");
        return 1;
    }

    auto *project = session.project();
    auto button = project->add_new_object(ObjectType::Button);
    auto key = project->add_new_object(ObjectType::Key, "Start Key");
    if (!button.is_ok() || !key.is_ok()) {
        echo::error("could not add objects");
        return 1;
    }
    auto attached = project->attach_child(2, button.value(), Point{10, 20});
    if (!attached.is_ok()) {
        echo::error("attach failed: ", attached.error().message);
    }
    auto outcome = session.tick();
    echo::info("Pool changed: ", outcome.pool_changed, ", selection changed: ", outcome.selection_changed);

    for (const auto &obj : project->pool().objects()) {
        echo::info("  ", obj.id, " -> ", project->display_name(obj));
    }

    project->undo();
    echo::info("After undo: ", project->pool().size(), " objects, redo available: ", project->redo_available());
    project->redo();
    echo::info("After redo: ", project->pool().size(), " objects");

    const dp::String out = "/tmp/designer_session_demo.vtdp";
    auto saved = session.save_project(out);
    if (saved.is_ok()) {
        echo::info("Project saved to ", out);
    } else {
        echo::error("save failed: ", saved.error().message);
    }

    echo::info("=== Designer Session Demo Complete ===");
    return 0;
}
