#include <doctest/doctest.h>

// Include the master header to verify all headers compile together
#include <vtdesigner.hpp>

TEST_CASE("All headers compile") {
    // If this compiles, all headers are syntactically valid
    CHECK(true);
}

TEST_CASE("Core types available") {
    vtdesigner::ObjectID id = 42;
    vtdesigner::NullableObjectID none;
    CHECK(id == 42);
    CHECK(none.is_null());
    CHECK(vtdesigner::MAX_OBJECT_ID == 0xFFFE);
}

TEST_CASE("Object constructible") {
    vtdesigner::VTObject obj;
    obj.set_id(7).set_type(vtdesigner::ObjectType::Button).set_size(80, 30);
    CHECK(obj.id == 7);
    CHECK(obj.width == 80);
}

TEST_CASE("Editor constructible") {
    vtdesigner::ObjectPool pool;
    auto project = vtdesigner::EditorProject::from_pool(pool);
    CHECK(project.pool().empty());
    CHECK_FALSE(project.undo_available());

    vtdesigner::DesignerSession session;
    CHECK_FALSE(session.has_project());
}
