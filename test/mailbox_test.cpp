#include <doctest/doctest.h>
#include <thread>
#include <vtdesigner/util/mailbox.hpp>

using namespace vtdesigner;
using namespace vtdesigner::util;

TEST_CASE("Mailbox delivers once") {
    Mailbox<int> box;
    CHECK(box.empty());
    CHECK_FALSE(box.try_receive().has_value());

    box.send(7);
    CHECK_FALSE(box.empty());
    auto got = box.try_receive();
    REQUIRE(got.has_value());
    CHECK(*got == 7);
    CHECK(box.empty());
    CHECK_FALSE(box.try_receive().has_value());
}

TEST_CASE("Mailbox keeps only the newest value") {
    Mailbox<dp::String> box;
    box.send("stale");
    box.send("fresh");
    auto got = box.try_receive();
    REQUIRE(got.has_value());
    CHECK(*got == "fresh");
    CHECK_FALSE(box.try_receive().has_value());

    box.send("dropped");
    box.clear();
    CHECK(box.empty());
}

TEST_CASE("Mailbox across threads") {
    Mailbox<int> box;
    std::thread producer([&box]() {
        for (int i = 1; i <= 100; ++i)
            box.send(i);
    });
    producer.join();

    auto got = box.try_receive();
    REQUIRE(got.has_value());
    CHECK(*got == 100);
}
