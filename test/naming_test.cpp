#include <doctest/doctest.h>
#include <string>
#include <vtdesigner/editor/naming.hpp>

using namespace vtdesigner;
using namespace vtdesigner::editor;
using namespace vtdesigner::vt;

namespace {
    dp::Vector<ObjectID> all_ids(const ObjectPool &pool) {
        dp::Vector<ObjectID> ids;
        for (const auto &obj : pool.objects())
            ids.push_back(obj.id);
        return ids;
    }

    bool all_names_unique(const ObjectPool &pool, const ObjectInfoTable &table) {
        auto registry = NameRegistry::from_pool(pool, table);
        for (const auto &obj : pool.objects()) {
            if (registry.count(table.display_name(obj)) != 1)
                return false;
        }
        return true;
    }
} // namespace

TEST_CASE("Type labels") {
    CHECK(dp::String(object_type_label(ObjectType::InputBoolean)) == "Checkbox");
    CHECK(dp::String(object_type_label(ObjectType::AlarmMask)) == "Alarm Screen");
    CHECK(dp::String(object_type_label(ObjectType::OutputString)) == "Text Display");
    for (auto type : all_object_types())
        CHECK_FALSE(dp::String(object_type_label(type)).empty());
}

TEST_CASE("NameRegistry counts displayed names") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::Button))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::Button));
    ObjectInfoTable table;
    table.get_or_create(*pool.object_by_id(2)).set_name("Go");

    auto registry = NameRegistry::from_pool(pool, table);
    CHECK(registry.contains("1: Button"));
    CHECK(registry.contains("Go"));
    CHECK_FALSE(registry.contains("2: Button"));

    registry.add("Go");
    CHECK(registry.count("Go") == 2);
    registry.remove("Go");
    registry.remove("Go");
    CHECK_FALSE(registry.contains("Go"));
    registry.remove("Go");
    CHECK(registry.count("Go") == 0);
}

TEST_CASE("Contextual names") {
    ObjectPool pool;
    auto key = [](u8 code) { return VTObject{}.set_type(ObjectType::Key).set_key_code(code); };

    CHECK(*generate_contextual_name(key(0), pool) == "ACK/Enter Key");
    CHECK(*generate_contextual_name(key(1), pool) == "ESC Key");
    CHECK(*generate_contextual_name(key(2), pool) == "Soft Key 1");
    CHECK(*generate_contextual_name(key(7), pool) == "Soft Key 6");
    CHECK_FALSE(generate_contextual_name(key(8), pool).has_value());

    auto button = VTObject{}.set_type(ObjectType::Button);
    CHECK(*generate_contextual_name(button.set_key_code(0), pool) == "OK Button");
    CHECK(*generate_contextual_name(button.set_key_code(1), pool) == "Cancel Button");
    CHECK_FALSE(generate_contextual_name(button.set_key_code(2), pool).has_value());

    auto container = VTObject{}.set_type(ObjectType::Container);
    CHECK(*generate_contextual_name(container.set_size(200, 60), pool) == "Header Container");
    CHECK(*generate_contextual_name(container.set_size(200, 400), pool) == "Main Container");
    CHECK_FALSE(generate_contextual_name(container.set_size(200, 200), pool).has_value());

    CHECK_FALSE(generate_contextual_name(VTObject{}.set_type(ObjectType::OutputString), pool).has_value());
}

TEST_CASE("Smart default names") {
    NameRegistry registry;

    SUBCASE("first data mask is the main screen") {
        CHECK(generate_smart_default_name(ObjectType::DataMask, 0, registry) == "Main Screen");
        CHECK(generate_smart_default_name(ObjectType::DataMask, 1, registry) == "Data Screen 2");
        CHECK(generate_smart_default_name(ObjectType::DataMask, 2, registry) == "Data Screen 3");
    }

    SUBCASE("other types use their label") {
        CHECK(generate_smart_default_name(ObjectType::InputString, 0, registry) == "Text Input");
        CHECK(generate_smart_default_name(ObjectType::InputString, 3, registry) == "Text Input 4");
    }

    SUBCASE("taken names are skipped") {
        registry.add("Checkbox");
        registry.add("Checkbox 2");
        CHECK(generate_smart_default_name(ObjectType::InputBoolean, 0, registry) == "Checkbox 1");
        CHECK(generate_smart_default_name(ObjectType::InputBoolean, 1, registry) == "Checkbox 3");
    }
}

TEST_CASE("make_unique_name") {
    NameRegistry registry;
    CHECK(make_unique_name("OK Button", registry) == "OK Button");
    registry.add("OK Button");
    CHECK(make_unique_name("OK Button", registry) == "OK Button 2");
    registry.add("OK Button 2");
    CHECK(make_unique_name("OK Button", registry) == "OK Button 3");
}

TEST_CASE("Names suggested for new children") {
    ObjectPool pool;
    pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::SoftKeyMask).set_object_list({2, 3}))
        .with_object(VTObject{}.set_id(2).set_type(ObjectType::Key))
        .with_object(VTObject{}.set_id(3).set_type(ObjectType::Key))
        .with_object(VTObject{}.set_id(4).set_type(ObjectType::DataMask).add_child(5, 0, 0))
        .with_object(VTObject{}.set_id(5).set_type(ObjectType::Container).set_size(200, 40))
        .with_object(VTObject{}.set_id(6).set_type(ObjectType::DataMask));

    CHECK(*suggest_name_for_child(*pool.object_by_id(1), ObjectType::Key, pool) == "F3 Key");
    CHECK(*suggest_name_for_child(*pool.object_by_id(6), ObjectType::Container, pool) == "Header Container");
    CHECK(*suggest_name_for_child(*pool.object_by_id(4), ObjectType::Container, pool) == "Main Container");
    CHECK(*suggest_name_for_child(*pool.object_by_id(5), ObjectType::Button, pool) == "Container Button");
    CHECK(*suggest_name_for_child(*pool.object_by_id(5), ObjectType::OutputString, pool) == "Container Label");
    CHECK_FALSE(suggest_name_for_child(*pool.object_by_id(5), ObjectType::Key, pool).has_value());
}

TEST_CASE("validate_name") {
    NameRegistry registry;
    registry.add("Main Screen");

    CHECK(validate_name("Settings", registry).is_ok());

    auto blank = validate_name("   ", registry);
    CHECK(blank.is_err());
    CHECK(blank.error().code == ErrorCode::InvalidName);
    CHECK(validate_name("", registry).is_err());

    dp::String long_name(std::string(101, 'x'));
    CHECK(validate_name(long_name, registry).is_err());
    CHECK(validate_name(dp::String(std::string(100, 'x')), registry).is_ok());

    auto taken = validate_name("Main Screen", registry);
    REQUIRE(taken.is_err());
    CHECK(taken.error().message.find("Main Screen 2") != dp::String::npos);
}

TEST_CASE("Batch smart naming") {
    SUBCASE("masks get screen names") {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::DataMask))
            .with_object(VTObject{}.set_id(2).set_type(ObjectType::DataMask))
            .with_object(VTObject{}.set_id(3).set_type(ObjectType::DataMask));
        ObjectInfoTable table;

        CHECK(apply_smart_naming(pool, table, all_ids(pool)) == 3);
        CHECK(table.display_name(*pool.object_by_id(1)) == "Main Screen");
        CHECK(table.display_name(*pool.object_by_id(2)) == "Data Screen 2");
        CHECK(table.display_name(*pool.object_by_id(3)) == "Data Screen 3");
    }

    SUBCASE("contextual names are made unique") {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::Key).set_key_code(0))
            .with_object(VTObject{}.set_id(2).set_type(ObjectType::Key).set_key_code(0))
            .with_object(VTObject{}.set_id(3).set_type(ObjectType::Key).set_key_code(3));
        ObjectInfoTable table;

        apply_smart_naming(pool, table, all_ids(pool));
        CHECK(table.display_name(*pool.object_by_id(1)) == "ACK/Enter Key");
        CHECK(table.display_name(*pool.object_by_id(2)) == "ACK/Enter Key 2");
        CHECK(table.display_name(*pool.object_by_id(3)) == "Soft Key 2");
    }

    SUBCASE("unique custom names are kept, duplicated ones renamed") {
        ObjectPool pool;
        pool.with_object(VTObject{}.set_id(1).set_type(ObjectType::Button).set_key_code(5))
            .with_object(VTObject{}.set_id(2).set_type(ObjectType::Button).set_key_code(5))
            .with_object(VTObject{}.set_id(3).set_type(ObjectType::Button).set_key_code(5))
            .with_object(VTObject{}.set_id(4).set_type(ObjectType::OutputString));
        ObjectInfoTable table;
        table.get_or_create(*pool.object_by_id(1)).set_name("Start");
        table.get_or_create(*pool.object_by_id(2)).set_name("Start");
        table.get_or_create(*pool.object_by_id(4)).set_name("Button 2");

        auto named = apply_smart_naming(pool, table, all_ids(pool));
        CHECK(named == 2);
        CHECK(table.display_name(*pool.object_by_id(2)) == "Start");
        CHECK(table.display_name(*pool.object_by_id(4)) == "Button 2");
        CHECK(table.display_name(*pool.object_by_id(1)) == "Button");
        CHECK(table.display_name(*pool.object_by_id(3)) == "Button 3");
        CHECK(all_names_unique(pool, table));
    }

    SUBCASE("uniqueness holds over a large mixed batch") {
        ObjectPool pool;
        ObjectID id = 1;
        for (int i = 0; i < 12; ++i) {
            pool.with_object(VTObject{}.set_id(id++).set_type(ObjectType::Button).set_key_code(static_cast<u8>(i % 3)));
            pool.with_object(VTObject{}.set_id(id++).set_type(ObjectType::Key).set_key_code(static_cast<u8>(i % 9)));
            pool.with_object(VTObject{}.set_id(id++).set_type(ObjectType::DataMask));
            pool.with_object(VTObject{}.set_id(id++).set_type(ObjectType::Container).set_size(10, 50));
        }
        ObjectInfoTable table;
        CHECK(apply_smart_naming(pool, table, all_ids(pool)) == pool.size());
        CHECK(all_names_unique(pool, table));

        // Running again has nothing left to do
        CHECK(apply_smart_naming(pool, table, all_ids(pool)) == 0);
    }

    SUBCASE("unknown ids are skipped") {
        ObjectPool pool;
        ObjectInfoTable table;
        CHECK(apply_smart_naming(pool, table, {42}) == 0);
    }
}
