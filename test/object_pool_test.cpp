#include <doctest/doctest.h>
#include <vtdesigner/vt/object_defaults.hpp>
#include <vtdesigner/vt/object_pool.hpp>

using namespace vtdesigner;
using namespace vtdesigner::vt;

namespace {
    // DataMask 1 > Container 2 at (10,10) > Button 3 at (5,5)
    ObjectPool nested_pool() {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::DataMask).add_child(2, 10, 10))
            .with_object(VTObject{}.set_id(2).set_type(ObjectType::Container).set_size(100, 100).add_child(3, 5, 5))
            .with_object(VTObject{}.set_id(3).set_type(ObjectType::Button).set_size(50, 20));
        return pool;
    }
} // namespace

TEST_CASE("ObjectPool add and lookup") {
    ObjectPool pool;
    CHECK(pool.empty());

    auto r = pool.add(VTObject{}.set_id(7).set_type(ObjectType::Button));
    CHECK(r.is_ok());
    CHECK(pool.size() == 1);
    CHECK(pool.contains(7));
    REQUIRE(pool.object_by_id(7) != nullptr);
    CHECK(pool.object_by_id(7)->type == ObjectType::Button);
    CHECK(pool.object_by_id(8) == nullptr);

    SUBCASE("duplicate id is rejected") {
        auto dup = pool.add(VTObject{}.set_id(7).set_type(ObjectType::Key));
        CHECK(dup.is_err());
        CHECK(dup.error().code == ErrorCode::IdConflict);
        CHECK(pool.size() == 1);
        CHECK(pool.object_by_id(7)->type == ObjectType::Button);
    }
}

TEST_CASE("ObjectPool type queries") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::DataMask))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::Button))
        .with_object(VTObject{}.set_id(3).set_type(ObjectType::DataMask))
        .with_object(VTObject{}.set_id(4).set_type(ObjectType::AlarmMask));

    CHECK(pool.objects_by_type(ObjectType::DataMask).size() == 2);
    CHECK(pool.count_of_type(ObjectType::Button) == 1);
    auto masks = pool.objects_by_types({ObjectType::DataMask, ObjectType::AlarmMask});
    REQUIRE(masks.size() == 3);
    CHECK(masks[0]->id == 1);
    CHECK(masks[2]->id == 4);
    CHECK(pool.max_object_id().has_value());
    CHECK(*pool.max_object_id() == 4);
    CHECK_FALSE(ObjectPool{}.max_object_id().has_value());
}

TEST_CASE("ObjectPool working set lookup") {
    SUBCASE("no working set") {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(5).set_type(ObjectType::DataMask));
        CHECK(pool.working_set_object() == nullptr);
    }

    SUBCASE("first working set wins") {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(5).set_type(ObjectType::DataMask))
            .with_object(VTObject{}.set_id(8).set_type(ObjectType::WorkingSet))
            .with_object(VTObject{}.set_id(9).set_type(ObjectType::WorkingSet));
        REQUIRE(pool.working_set_object() != nullptr);
        CHECK(pool.working_set_object()->id == 8);
    }
}

TEST_CASE("ObjectPool parent_objects") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::WorkingSet).set_field(FieldRole::ActiveMask, 2))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::DataMask).add_child(3, 0, 0))
        .with_object(VTObject{}.set_id(3).set_type(ObjectType::Button))
        .with_object(VTObject{}.set_id(4).set_type(ObjectType::SoftKeyMask).set_object_list({3}));

    auto parents = pool.parent_objects(3);
    REQUIRE(parents.size() == 2);
    CHECK(parents[0]->id == 2);
    CHECK(parents[1]->id == 4);

    auto ws_parents = pool.parent_objects(2);
    REQUIRE(ws_parents.size() == 1);
    CHECK(ws_parents[0]->id == 1);
}

TEST_CASE("ObjectPool remove never cascades") {
    auto pool = nested_pool();
    CHECK(pool.remove(3));
    CHECK_FALSE(pool.remove(3));
    CHECK_FALSE(pool.contains(3));

    const auto *container = pool.object_by_id(2);
    REQUIRE(container != nullptr);
    REQUIRE(container->object_refs.size() == 1);
    CHECK(container->object_refs[0].id == 3);

    auto dangling = pool.dangling_references();
    REQUIRE(dangling.size() == 1);
    CHECK(dangling[0].owner == 2);
    CHECK(dangling[0].target == 3);
    CHECK(dangling[0].kind == ReferenceKind::Child);

    // Index still resolves the objects behind the removed one
    CHECK(pool.object_by_id(1)->type == ObjectType::DataMask);
}

TEST_CASE("ObjectPool dangling reference kinds") {
    ObjectPool pool;
    pool.with_object(VTObject{}
                         .set_id(1)
                         .set_type(ObjectType::OutputString)
                         .set_field(FieldRole::FontAttributes, 50)
                         .set_field(FieldRole::Variable, NullableObjectID::none())
                         .add_macro(Event::OnChangeValue, 60))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::InputList).set_object_list({70, NULL_OBJECT_ID}));

    auto dangling = pool.dangling_references();
    REQUIRE(dangling.size() == 3);
    CHECK(dangling[0].kind == ReferenceKind::Field);
    CHECK(dangling[0].target == 50);
    CHECK(dangling[1].kind == ReferenceKind::Macro);
    CHECK(dangling[1].target == 60);
    CHECK(dangling[2].kind == ReferenceKind::ListItem);
    CHECK(dangling[2].target == 70);
}

TEST_CASE("ObjectPool change_id") {
    auto pool = nested_pool();

    SUBCASE("renumbers the object only") {
        auto r = pool.change_id(3, 30);
        CHECK(r.is_ok());
        CHECK(pool.contains(30));
        CHECK_FALSE(pool.contains(3));
        CHECK(pool.object_by_id(2)->object_refs[0].id == 3);
    }

    SUBCASE("rejects a used target") {
        auto r = pool.change_id(3, 2);
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::IdConflict);
        CHECK(pool.contains(3));
    }

    SUBCASE("rejects the NULL id and unknown sources") {
        CHECK(pool.change_id(3, NULL_OBJECT_ID).is_err());
        auto missing = pool.change_id(99, 100);
        CHECK(missing.is_err());
        CHECK(missing.error().code == ErrorCode::ObjectNotFound);
    }

    SUBCASE("renumbering through a mutable pointer keeps lookups working") {
        pool.object_by_id_mut(3)->id = 33;
        CHECK(pool.object_by_id(33) != nullptr);
        CHECK(pool.object_by_id(3) == nullptr);
    }
}

TEST_CASE("ObjectPool content_size") {
    auto pool = nested_pool();

    CHECK(pool.content_size(*pool.object_by_id(3)) == Size{50, 20});
    CHECK(pool.content_size(*pool.object_by_id(2)) == Size{100, 100});
    CHECK(pool.content_size(*pool.object_by_id(1)) == Size{110, 110});

    SUBCASE("object pointer takes its target's extent") {
        pool.with_object(VTObject{}.set_id(4).set_type(ObjectType::ObjectPointer).set_field(FieldRole::Value, 3));
        pool.with_object(VTObject{}.set_id(5).set_type(ObjectType::ObjectPointer).set_field(FieldRole::Value, 99));
        pool.with_object(default_object(ObjectType::ObjectPointer).set_id(6));
        CHECK(pool.content_size(*pool.object_by_id(4)) == Size{50, 20});
        CHECK(pool.content_size(*pool.object_by_id(5)) == Size{0, 0});
        CHECK(pool.content_size(*pool.object_by_id(6)) == Size{0, 0});
    }

    SUBCASE("reference cycles terminate") {
        ObjectPool cyclic;
        cyclic.with_object(VTObject{}.set_id(1).set_type(ObjectType::Key).add_child(2, 5, 5))
            .with_object(VTObject{}.set_id(2).set_type(ObjectType::ObjectPointer).set_field(FieldRole::Value, 1));
        auto size = cyclic.content_size(*cyclic.object_by_id(1));
        CHECK(size.width == size.height);
    }
}

TEST_CASE("ObjectPool object_at") {
    auto pool = nested_pool();

    CHECK(pool.object_at(1, Point{20, 20}) == NullableObjectID{3});
    CHECK(pool.object_at(1, Point{100, 100}) == NullableObjectID{2});
    CHECK(pool.object_at(1, Point{150, 150}) == NullableObjectID{1});
    CHECK(pool.object_at(99, Point{0, 0}).is_null());

    SUBCASE("later children are on top") {
        pool.object_by_id_mut(1)->add_child(3, 10, 10);
        CHECK(pool.object_at(1, Point{12, 12}) == NullableObjectID{3});
    }
}

TEST_CASE("ObjectPool minimum_mask_sizes") {
    SUBCASE("empty pool gives the ISO minimums") {
        auto [mask, soft_key] = ObjectPool{}.minimum_mask_sizes();
        CHECK(mask == MIN_MASK_SIZE);
        CHECK(soft_key == Size{MIN_SOFT_KEY_WIDTH, MIN_SOFT_KEY_HEIGHT});
    }

    SUBCASE("grows to fit mask and key contents") {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::DataMask).add_child(2, 150, 150))
            .with_object(VTObject{}.set_id(2).set_type(ObjectType::Container).set_size(100, 100))
            .with_object(VTObject{}.set_id(3).set_type(ObjectType::Key).add_child(4, 0, 0))
            .with_object(VTObject{}.set_id(4).set_type(ObjectType::OutputString).set_size(100, 20));
        auto [mask, soft_key] = pool.minimum_mask_sizes();
        CHECK(mask == 250);
        CHECK(soft_key == Size{100, 32});
    }
}

TEST_CASE("ObjectPool structural equality") {
    auto a = nested_pool();
    auto b = nested_pool();
    CHECK(a == b);

    b.object_by_id_mut(3)->width = 51;
    CHECK(a != b);

    auto c = nested_pool();
    c.object_by_id_mut(1)->object_refs[0].offset.x = 11;
    CHECK(a != c);
}

TEST_CASE("Default objects") {
    auto button = default_object(ObjectType::Button);
    CHECK(button.type == ObjectType::Button);
    CHECK(button.width == 100);
    CHECK(button.height == 40);

    auto ws = default_object(ObjectType::WorkingSet);
    CHECK(ws.field(FieldRole::ActiveMask).is_null());
    REQUIRE(ws.fields.size() == 1);

    for (auto type : all_object_types())
        CHECK(default_object(type).type == type);
}
