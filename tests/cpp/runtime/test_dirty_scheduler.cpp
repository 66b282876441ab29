#include <catch2/catch_test_macros.hpp>

#include <recomp/runtime/composer.h>
#include <recomp/runtime/dirty_scheduler.h>

#include <vector>

namespace {
    using namespace recomp;

    struct Leaf {
        static constexpr std::string_view name{"Leaf"};

        Children compose(Scope &) const { return {}; }
    };
} // namespace

TEST_CASE("Dirty scheduler drains in position order", "[scheduler]") {
    Composer composer{Leaf{}};
    Scope deep{composer, nullptr, Position{}.child(0).child(1), Element{Leaf{}}};
    Scope shallow{composer, nullptr, Position{}.child(0), Element{Leaf{}}};
    Scope sibling{composer, nullptr, Position{}.child(1), Element{Leaf{}}};

    DirtyScheduler scheduler;
    REQUIRE(scheduler.schedule(sibling));
    REQUIRE(scheduler.schedule(deep));
    REQUIRE(scheduler.schedule(shallow));
    REQUIRE(scheduler.size() == 3);

    std::vector<Scope::ptr> order;
    while (auto entry = scheduler.pop_first()) { order.push_back(entry->scope); }
    REQUIRE(order == std::vector<Scope::ptr>{&shallow, &deep, &sibling});
    REQUIRE(scheduler.empty());
}

TEST_CASE("Scheduling a pending scope again is a no-op", "[scheduler]") {
    Composer composer{Leaf{}};
    Scope scope{composer, nullptr, Position{}.child(3), Element{Leaf{}}};

    DirtyScheduler scheduler;
    REQUIRE(scheduler.schedule(scope));
    REQUIRE_FALSE(scheduler.schedule(scope));
    REQUIRE_FALSE(scheduler.schedule(scope));
    REQUIRE(scheduler.size() == 1);
    REQUIRE(scheduler.is_scheduled(scope));
}

TEST_CASE("Unscheduling only removes the same scope", "[scheduler]") {
    Composer composer{Leaf{}};
    Scope old_scope{composer, nullptr, Position{}.child(0), Element{Leaf{}}};
    Scope new_scope{composer, nullptr, Position{}.child(0), Element{Leaf{}}};

    DirtyScheduler scheduler;
    REQUIRE(scheduler.schedule(new_scope));
    REQUIRE_FALSE(scheduler.unschedule(old_scope));
    REQUIRE_FALSE(scheduler.is_scheduled(old_scope));
    REQUIRE(scheduler.is_scheduled(new_scope));
    REQUIRE(scheduler.unschedule(new_scope));
    REQUIRE(scheduler.empty());
}
