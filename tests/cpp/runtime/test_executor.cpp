#include <catch2/catch_test_macros.hpp>

#include <recomp/runtime/executor.h>

#include <stdexcept>
#include <vector>

TEST_CASE("Local executor runs queued tasks when polled", "[executor]") {
    using namespace recomp;
    LocalExecutor executor;
    auto token{std::make_shared<LifetimeToken>()};
    std::vector<std::string> ran;

    executor.spawn(Task{token, [&ran](const Task &task) { ran.push_back(task.label()); }, "first"});
    executor.spawn_local(Task{token, [&ran](const Task &task) { ran.push_back(task.label()); }, "second"});
    REQUIRE(ran.empty());
    REQUIRE(executor.pending() == 2);

    REQUIRE(executor.poll() == 2);
    REQUIRE(ran == std::vector<std::string>{"first", "second"});
    REQUIRE(executor.pending() == 0);
    REQUIRE(executor.poll() == 0);
}

TEST_CASE("Tasks spawned while polling wait for the next poll", "[executor]") {
    using namespace recomp;
    LocalExecutor executor;
    auto token{std::make_shared<LifetimeToken>()};
    int runs{0};

    executor.spawn_local(Task{token, [&](const Task &) {
        ++runs;
        executor.spawn_local(Task{token, [&runs](const Task &) { ++runs; }});
    }});

    REQUIRE(executor.poll() == 1);
    REQUIRE(runs == 1);
    REQUIRE(executor.poll() == 1);
    REQUIRE(runs == 2);
}

TEST_CASE("Cancelled tasks do not run", "[executor]") {
    using namespace recomp;
    LocalExecutor executor;
    auto token{std::make_shared<LifetimeToken>()};
    bool ran{false};

    Task task{token, [&ran](const Task &) { ran = true; }};
    REQUIRE_FALSE(task.cancelled());
    token->cancel();
    REQUIRE(task.cancelled());

    executor.spawn(std::move(task));
    executor.poll();
    REQUIRE_FALSE(ran);

    REQUIRE(Task{nullptr, [](const Task &) {}}.cancelled());
}

TEST_CASE("A failing task does not stop the others", "[executor]") {
    using namespace recomp;
    LocalExecutor executor;
    auto token{std::make_shared<LifetimeToken>()};
    bool second_ran{false};

    executor.spawn_local(Task{token, [](const Task &) { throw std::runtime_error("task failed"); }});
    executor.spawn_local(Task{token, [&second_ran](const Task &) { second_ran = true; }});

    REQUIRE_THROWS_AS(executor.poll(), std::runtime_error);
    REQUIRE(second_ran);
    REQUIRE(executor.pending() == 0);
}
