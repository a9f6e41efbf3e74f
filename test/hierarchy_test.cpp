#include <doctest/doctest.h>
#include <vtdesigner/editor/hierarchy.hpp>
#include <vtdesigner/editor/project.hpp>

using namespace vtdesigner;
using namespace vtdesigner::editor;
using namespace vtdesigner::vt;

TEST_CASE("Hierarchy without a working set") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(5).set_type(ObjectType::DataMask));
    ObjectInfoTable table;

    CHECK(pool.working_set_object() == nullptr);
    auto view = build_hierarchy(pool, table);
    CHECK(view.missing_working_set);
    CHECK(view.nodes.empty());
}

TEST_CASE("Hierarchy flattening") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::WorkingSet).set_field(FieldRole::ActiveMask, 2))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::DataMask).add_child(3, 0, 0).add_child(9, 0, 0))
        .with_object(VTObject{}.set_id(3).set_type(ObjectType::Container).set_size(50, 50).add_child(4, 0, 0))
        .with_object(VTObject{}.set_id(4).set_type(ObjectType::OutputString).set_size(40, 10));
    ObjectInfoTable table;
    table.get_or_create(*pool.object_by_id(2)).set_name("Home");

    auto view = build_hierarchy(pool, table);
    CHECK_FALSE(view.missing_working_set);
    REQUIRE(view.nodes.size() == 5);

    CHECK(view.nodes[0].id == 1);
    CHECK(view.nodes[0].depth == 0);
    CHECK(view.nodes[0].label == "1: WorkingSet");
    CHECK(view.nodes[0].has_children);

    CHECK(view.nodes[1].id == 2);
    CHECK(view.nodes[1].depth == 1);
    CHECK(view.nodes[1].label == "Home");

    CHECK(view.nodes[2].id == 3);
    CHECK(view.nodes[2].depth == 2);
    CHECK(view.nodes[3].id == 4);
    CHECK(view.nodes[3].depth == 3);
    CHECK_FALSE(view.nodes[3].has_children);

    CHECK(view.nodes[4].id == 9);
    CHECK(view.nodes[4].missing);
    CHECK(view.nodes[4].depth == 2);
    CHECK(view.nodes[4].label == "Missing object: 9");

    SUBCASE("path to a nested object") {
        auto path = view.path_to(4);
        REQUIRE(path.size() == 3);
        CHECK(path[0] == 1);
        CHECK(path[1] == 2);
        CHECK(path[2] == 3);
        CHECK(view.path_to(1).empty());
        CHECK(view.find(9) == nullptr);
        REQUIRE(view.find(3) != nullptr);
        CHECK(view.find(3)->depth == 2);
    }
}

TEST_CASE("Hierarchy stops at reference cycles") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::WorkingSet).set_field(FieldRole::ActiveMask, 2))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::DataMask).add_child(3, 0, 0))
        .with_object(VTObject{}.set_id(3).set_type(ObjectType::Container).add_child(2, 0, 0));
    ObjectInfoTable table;

    auto view = build_hierarchy(pool, table);
    REQUIRE(view.nodes.size() == 4);
    CHECK(view.nodes[3].id == 2);
    CHECK(view.nodes[3].recursion_cut);
    CHECK_FALSE(view.nodes[1].recursion_cut);
}

TEST_CASE("Removed objects show up as missing and never fail") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::WorkingSet).set_field(FieldRole::ActiveMask, 2))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::DataMask).add_child(3, 10, 10))
        .with_object(VTObject{}.set_id(3).set_type(ObjectType::Button).set_size(80, 30));
    auto project = EditorProject::from_pool(pool);

    REQUIRE(project.remove_object(3).is_ok());
    REQUIRE(project.remove_object(2).is_ok());
    project.update_pool();

    CHECK(project.pool().dangling_references().size() == 1);
    auto view = build_hierarchy(project.pool(), project.object_info());
    REQUIRE(view.nodes.size() == 2);
    CHECK(view.nodes[1].missing);
    CHECK(view.nodes[1].label == "Missing object: 2");

    const auto *ws = project.pool().working_set_object();
    REQUIRE(ws != nullptr);
    CHECK(project.pool().content_size(*ws) == Size{0, 0});
    CHECK(project.pool().object_at(1, Point{5, 5}) == NullableObjectID{1});
}
