#include <catch2/catch_test_macros.hpp>

#include <recomp/recomp.h>

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {
    using namespace recomp;

    struct Log {
        std::map<std::string, int> composed;
        std::map<std::string, Setter<int>> setters;
        std::vector<std::string> events;
    };

    using log_ptr = std::shared_ptr<Log>;

    struct B {
        static constexpr std::string_view name{"B"};

        log_ptr log;

        Children compose(Scope &scope) const {
            auto [value, set_value] = use_state(scope, 0);
            ++log->composed["B"];
            log->setters["B"] = set_value;
            log->events.push_back(fmt::format("B={}", *value));
            return {};
        }
    };

    struct C {
        static constexpr std::string_view name{"C"};

        log_ptr log;

        Children compose(Scope &scope) const {
            auto [value, set_value] = use_state(scope, 0);
            ++log->composed["C"];
            log->setters["C"] = set_value;
            return {};
        }
    };

    struct A {
        static constexpr std::string_view name{"A"};

        log_ptr log;

        Children compose(Scope &) const {
            ++log->composed["A"];
            return {B{log}, C{log}};
        }
    };

    struct Item {
        static constexpr std::string_view name{"Item"};

        int index;

        Children compose(Scope &) const { return {}; }
    };

    /**
     * Shows ``count`` items, the count is state so it can be changed incrementally.
     */
    struct List {
        static constexpr std::string_view name{"List"};

        log_ptr log;
        int initial;

        Children compose(Scope &scope) const {
            auto [count, set_count] = use_state(scope, initial);
            log->setters["List"] = set_count;
            std::vector<Element> items;
            for (int i = 0; i < *count; ++i) { items.emplace_back(Item{i}); }
            return Children(std::move(items));
        }
    };

    struct Page {
        static constexpr std::string_view name{"Page"};

        log_ptr log;
        int initial;

        Children compose(Scope &) const { return {B{log}, List{log, initial}}; }
    };

    struct Broken {
        static constexpr std::string_view name{"Broken"};

        log_ptr log;

        Children compose(Scope &scope) const {
            auto [fail, set_fail] = use_state(scope, 0);
            log->setters["Broken"] = set_fail;
            if (*fail != 0) { throw std::runtime_error("boom"); }
            return {B{log}};
        }
    };

    struct Holder {
        static constexpr std::string_view name{"Holder"};

        log_ptr log;

        Children compose(Scope &) const { return {Broken{log}, C{log}}; }
    };

    /**
     * Marks itself dirty while composing until it has composed three times.
     */
    struct Restless {
        static constexpr std::string_view name{"Restless"};

        Children compose(Scope &scope) const {
            auto &count{use_ref(scope, 0)};
            if (++count < 3) { scope.mark_dirty(); }
            return {};
        }
    };

    std::string dump_items(const Composer &composer) {
        std::string out{composer.to_string()};
        auto list{composer.scope_at(Position{}.child(1))};
        for (std::size_t i = 0; list != nullptr && i < list->child_count(); ++i) {
            out += fmt::format(" {}", list->child(i)->element().get<Item>()->index);
        }
        return out;
    }
} // namespace

// =====================================================================================================================
// Tree dump
// =====================================================================================================================

TEST_CASE("A composing B and C dumps as A(B, C)", "[composer]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};

    // Nothing is composed by the constructor
    REQUIRE(composer.to_string() == "A");
    REQUIRE(composer.compose_once().status == ComposeStatus::COMPOSED);
    REQUIRE(composer.to_string() == "A(B, C)");
    REQUIRE(fmt::format("{}", composer) == "A(B, C)");

    std::ostringstream os;
    os << composer;
    REQUIRE(os.str() == "A(B, C)");
}

TEST_CASE("Empty slots are not shown in the dump", "[composer]") {
    auto log{std::make_shared<Log>()};
    Composer composer{from_fn([log](Scope &) { return Children{nothing, C{log}, std::optional<B>{}}; })};
    REQUIRE(composer.compose_once());
    REQUIRE(composer.to_string() == "FromFn(C)");
    REQUIRE(composer.root().child_count() == 3);
    // The non-empty child keeps its slot index
    REQUIRE(composer.root().child(1)->position() == Position{}.child(1));
}

TEST_CASE("The root of a composer cannot be empty", "[composer]") {
    REQUIRE_THROWS_AS(Composer{Element{}}, std::invalid_argument);
}

// =====================================================================================================================
// Incremental recomposition
// =====================================================================================================================

TEST_CASE("A state change in B recomposes only B", "[composer][incremental]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    REQUIRE(composer.compose_once().scopes_composed == 3);

    auto b_scope{composer.scope_at(Position{}.child(0))};
    auto c_scope{composer.scope_at(Position{}.child(1))};

    REQUIRE(log->setters["B"].set(7));
    auto result{composer.compose_once()};
    REQUIRE(result.status == ComposeStatus::COMPOSED);
    REQUIRE(result.scopes_composed == 1);
    REQUIRE(log->composed["A"] == 1);
    REQUIRE(log->composed["B"] == 2);
    REQUIRE(log->composed["C"] == 1);
    REQUIRE(log->events.back() == "B=7");

    // Same scopes, only B has a new generation
    REQUIRE(composer.scope_at(Position{}.child(0)) == b_scope);
    REQUIRE(b_scope->generation() == 2);
    REQUIRE(c_scope->generation() == 1);
    REQUIRE(composer.to_string() == "A(B, C)");
}

TEST_CASE("Passes with nothing to do are idempotent", "[composer][incremental]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    REQUIRE(composer.compose_once());
    auto pass{composer.pass_id()};
    auto dump{composer.to_string()};

    for (int i = 0; i < 3; ++i) {
        auto result{composer.compose_once()};
        REQUIRE(result.status == ComposeStatus::PENDING);
        REQUIRE(result.scopes_composed == 0);
        REQUIRE(composer.scheduler().empty());
        REQUIRE(composer.to_string() == dump);
    }
    REQUIRE(composer.pass_id() == pass);
    REQUIRE(log->composed["A"] == 1);
    REQUIRE(log->composed["B"] == 1);
}

TEST_CASE("Many writes to one scope schedule it once", "[composer][incremental]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    REQUIRE(composer.compose_once());

    for (int i = 1; i <= 5; ++i) { REQUIRE(log->setters["B"].set(i)); }
    REQUIRE(composer.update_queue()->size() == 5);
    REQUIRE(composer.apply_updates() == 5);
    REQUIRE(composer.scheduler().size() == 1);
    REQUIRE(composer.scheduler().begin()->position == Position{}.child(0));

    auto result{composer.compose_once()};
    REQUIRE(result.scopes_composed == 1);
    REQUIRE(log->events.back() == "B=5");
}

TEST_CASE("Writes with an update function", "[composer][incremental]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    REQUIRE(composer.compose_once());

    REQUIRE(log->setters["B"].update([](int &v) { v += 2; }));
    REQUIRE(log->setters["B"].update([](int &v) { v *= 10; }));
    REQUIRE(composer.compose_once().scopes_composed == 1);
    REQUIRE(log->events.back() == "B=20");
}

TEST_CASE("Incremental recomposition matches a full rebuild", "[composer][incremental]") {
    auto log{std::make_shared<Log>()};
    Composer incremental{Page{log, 2}};
    REQUIRE(incremental.compose_once());
    REQUIRE(dump_items(incremental) == "Page(B, List(Item, Item)) 0 1");

    auto list_setter{log->setters["List"]};
    auto first_item{incremental.scope_at(Position{}.child(1).child(0))};

    SECTION("growing") {
        REQUIRE(list_setter.set(4));
        REQUIRE(incremental.compose_once());

        auto rebuilt_log{std::make_shared<Log>()};
        Composer rebuilt{Page{rebuilt_log, 4}};
        REQUIRE(rebuilt.compose_once());

        REQUIRE(dump_items(incremental) == dump_items(rebuilt));
        // The existing items were kept
        REQUIRE(incremental.scope_at(Position{}.child(1).child(0)) == first_item);
    }

    SECTION("shrinking") {
        REQUIRE(list_setter.set(1));
        REQUIRE(incremental.compose_once());

        auto rebuilt_log{std::make_shared<Log>()};
        Composer rebuilt{Page{rebuilt_log, 1}};
        REQUIRE(rebuilt.compose_once());

        REQUIRE(dump_items(incremental) == dump_items(rebuilt));
        REQUIRE(incremental.to_string() == "Page(B, List(Item))");
    }

    // B sits outside the affected subtree and was left alone
    REQUIRE(log->composed["B"] == 1);
}

TEST_CASE("A scope dirtied during its own composition is recomposed in the next pass", "[composer][incremental]") {
    Composer composer{Restless{}};
    REQUIRE(composer.compose_once().scopes_composed == 1);
    REQUIRE(composer.compose_once().scopes_composed == 1);
    REQUIRE(composer.compose_once().scopes_composed == 1);
    REQUIRE(composer.compose_once().status == ComposeStatus::PENDING);
    REQUIRE(composer.root().generation() == 3);
}

// =====================================================================================================================
// Step-wise driving
// =====================================================================================================================

TEST_CASE("Step composes one scope at a time", "[composer][step]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};

    std::vector<std::string> names;
    for (auto &scope: composer.steps()) { names.emplace_back(scope.name()); }
    REQUIRE(names == std::vector<std::string>{"A", "B", "C"});
    REQUIRE_FALSE(composer.in_pass());

    REQUIRE(log->setters["C"].set(1));
    REQUIRE(log->setters["B"].set(1));

    auto first{composer.step()};
    REQUIRE(first != nullptr);
    REQUIRE(first->name() == "B");
    REQUIRE(composer.in_pass());

    // The host may stop here and resume later
    auto second{composer.step()};
    REQUIRE(second->name() == "C");
    REQUIRE(composer.step() == nullptr);
    REQUIRE_FALSE(composer.in_pass());
    REQUIRE(composer.step() == nullptr);
}

TEST_CASE("compose_once completes a pass started with step", "[composer][step]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    REQUIRE(composer.step()->name() == "A");

    auto result{composer.compose_once()};
    REQUIRE(result.status == ComposeStatus::COMPOSED);
    REQUIRE(result.scopes_composed == 2);
    REQUIRE(composer.to_string() == "A(B, C)");
}

TEST_CASE("Updates cannot be applied in the middle of a pass", "[composer][step]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    REQUIRE(composer.step() != nullptr);
    REQUIRE_THROWS_AS(composer.apply_updates(), std::logic_error);
}

// =====================================================================================================================
// Failures
// =====================================================================================================================

TEST_CASE("An unhandled failure is reported and leaves the tree as it was", "[composer][errors]") {
    auto log{std::make_shared<Log>()};
    Composer composer{Holder{log}};
    REQUIRE(composer.compose_once());
    REQUIRE(composer.to_string() == "Holder(Broken(B), C)");
    auto broken{composer.scope_at(Position{}.child(0))};

    REQUIRE(log->setters["Broken"].set(1));
    auto result{composer.compose_once()};
    REQUIRE(result.failed());
    REQUIRE_FALSE(result);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->scope_name == "Broken");
    REQUIRE(result.error->scope_path == "Holder/Broken");
    REQUIRE(result.error->position == "[0]");
    REQUIRE(result.error->error_msg == "boom");

    REQUIRE(composer.to_string() == "Holder(Broken(B), C)");
    REQUIRE(composer.scope_at(Position{}.child(0)) == broken);
    REQUIRE(broken->generation() == 1);
    REQUIRE_FALSE(composer.in_pass());

    // Not retried automatically
    REQUIRE(composer.compose_once().status == ComposeStatus::PENDING);

    // Recovering the state recomposes it
    REQUIRE(log->setters["Broken"].set(0));
    REQUIRE(composer.compose_once().status == ComposeStatus::COMPOSED);
    REQUIRE(broken->generation() == 2);
}

TEST_CASE("step throws an unhandled failure as a CompositionException", "[composer][errors]") {
    auto log{std::make_shared<Log>()};
    Composer composer{Holder{log}};
    REQUIRE(composer.compose_once());
    REQUIRE(log->setters["Broken"].set(1));

    try {
        while (composer.step() != nullptr) {}
        FAIL("Expected a CompositionException");
    } catch (const CompositionException &e) {
        REQUIRE(e.scope_name == "Broken");
        REQUIRE(std::string{e.what()}.find("boom") != std::string::npos);
    }
}

TEST_CASE("Wake callback is called for writes", "[composer]") {
    auto log{std::make_shared<Log>()};
    Composer composer{A{log}};
    int wakes{0};
    composer.set_wake_callback([&wakes] { ++wakes; });
    REQUIRE(composer.compose_once());

    REQUIRE(log->setters["B"].set(1));
    REQUIRE(log->setters["C"].set(1));
    REQUIRE(wakes == 2);
}

TEST_CASE("Setters that outlive their composer drop their writes", "[composer]") {
    auto log{std::make_shared<Log>()};
    Setter<int> setter;
    {
        Composer composer{A{log}};
        REQUIRE(composer.compose_once());
        setter = log->setters["B"];
        REQUIRE(setter.alive());
    }
    log->setters.clear();
    REQUIRE_FALSE(setter.alive());
    REQUIRE_FALSE(setter.set(1));
}
