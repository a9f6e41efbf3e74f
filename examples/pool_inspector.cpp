#include <echo/echo.hpp>
#include <string>
#include <vtdesigner.hpp>

using namespace vtdesigner;
using namespace vtdesigner::editor;
using namespace vtdesigner::util;
using namespace vtdesigner::vt;

int main(int argc, char **argv) {
    if (argc < 2) {
        echo::error("usage: pool_inspector <pool.iop>");
        return 1;
    }

    auto bytes = IOPParser::read_iop_file(argv[1]);
    if (!bytes.is_ok()) {
        echo::error("read failed: ", bytes.error().message);
        return 1;
    }

    auto loaded = EditorProject::from_iop(bytes.value());
    if (!loaded.is_ok()) {
        echo::error("parse failed: ", loaded.error().message);
        return 1;
    }
    auto &project = loaded.value();
    const auto &pool = project.pool();

    echo::info("=== ", argv[1], " (", pool.size(), " objects, ", bytes.value().size(), " bytes) ===");
    echo::info("Mask ", project.mask_size(), "px, soft keys ", project.soft_key_size().width, "x",
               project.soft_key_size().height);

    auto view = build_hierarchy(pool, project.object_info());
    if (view.missing_working_set) {
        echo::warn("No working set object in pool");
    }
    for (const auto &node : view.nodes) {
        dp::String indent(std::string(node.depth * 2, ' '));
        echo::info(indent, node.label, node.recursion_cut ? " (cycle)" : "");
    }

    for (const auto &ref : pool.dangling_references()) {
        echo::warn("Object ", ref.owner, " references missing object ", ref.target);
    }
    auto highest = pool.max_object_id();
    if (highest.has_value()) {
        echo::info("Highest object id: ", *highest);
    }
    return 0;
}
