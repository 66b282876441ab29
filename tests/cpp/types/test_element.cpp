#include <catch2/catch_test_macros.hpp>

#include <recomp/recomp.h>

#include <optional>
#include <stdexcept>
#include <type_traits>

namespace {
    using namespace recomp;

    struct Label {
        static constexpr std::string_view name{"Label"};

        std::string text;

        Children compose(Scope &) const { return {}; }
    };

    struct Plain {
        int value{0};

        Children compose(Scope &) const { return {}; }
    };

    /**
     * Produces the same node in two slots.
     */
    struct Twice {
        static constexpr std::string_view name{"Twice"};

        Element content;

        Children compose(Scope &) const { return {content, content}; }
    };

    struct Counted {
        static constexpr std::string_view name{"Counted"};

        Children compose(Scope &scope) const {
            auto [count, set_count] = use_state(scope, 0);
            return {};
        }
    };
} // namespace

TEST_CASE("Element carries the runtime type identity", "[element]") {
    Element label{Label{"hello"}};
    Element plain{Plain{3}};

    REQUIRE(label.type_id() == std::type_index{typeid(Label)});
    REQUIRE(label.is<Label>());
    REQUIRE_FALSE(label.is<Plain>());
    REQUIRE(label.type_id() != plain.type_id());

    REQUIRE(label.get<Label>() != nullptr);
    REQUIRE(label.get<Label>()->text == "hello");
    REQUIRE(label.get<Plain>() == nullptr);
    REQUIRE(plain.get<Plain>()->value == 3);
}

TEST_CASE("Element names", "[element]") {
    REQUIRE(Element{Label{}}.name() == "Label");
    // Without a name member the unqualified type name is used
    REQUIRE(Element{Plain{}}.name() == "Plain");
    REQUIRE(Element{}.name().empty());
}

TEST_CASE("Empty elements", "[element]") {
    Element empty{};
    REQUIRE(empty.empty());
    REQUIRE_FALSE(empty);
    REQUIRE(empty.type_id() == std::type_index{typeid(void)});
    REQUIRE(nothing.empty());

    Element none{std::optional<Label>{}};
    REQUIRE(none.empty());
    Element some{std::optional<Label>{Label{"x"}}};
    REQUIRE(some.is<Label>());
}

TEST_CASE("Children", "[element]") {
    Children children{Label{"a"}, Plain{}, nothing};
    REQUIRE(children.size() == 3);
    REQUIRE(children[0].is<Label>());
    REQUIRE(children[2].empty());
    REQUIRE_THROWS_AS(children[3], std::out_of_range);

    children.push_back(Label{"b"});
    REQUIRE(children.size() == 4);

    auto keep{Children::keep()};
    REQUIRE(keep.keeps_previous());
    REQUIRE_THROWS_AS(keep.push_back(Label{}), std::logic_error);

    Children single{Label{"only"}};
    REQUIRE(single.size() == 1);
}

TEST_CASE("Child lists are plain values", "[element]") {
    STATIC_REQUIRE(std::is_copy_constructible_v<Children>);
    STATIC_REQUIRE(std::is_nothrow_move_constructible_v<Children>);
    // A child list is not itself a node
    STATIC_REQUIRE_FALSE(std::is_constructible_v<Element, Children>);

    Children original{Label{"a"}, Plain{}};
    Children copy{original};
    REQUIRE(copy.size() == 2);
    REQUIRE(copy[0].same_node(original[0]));

    Children moved{std::move(copy)};
    REQUIRE(moved.size() == 2);

    auto keep{Children::keep()};
    auto kept{keep};
    REQUIRE(kept.keeps_previous());

    auto rebuilt{Children::rebuild({Label{"b"}})};
    REQUIRE(rebuilt.rebuilds());
    REQUIRE(rebuilt.size() == 1);
    REQUIRE_THROWS_AS(Children::rebuild(Children::keep()), std::logic_error);
}

TEST_CASE("Two handles into one erased node", "[element][aliasing]") {
    Element original{Counted{}};
    Element alias{original};

    REQUIRE(alias.same_node(original));
    REQUIRE(original.node().use_count() == 2);
    // Nodes can only be reached as const
    STATIC_REQUIRE(std::is_const_v<std::remove_reference_t<decltype(*original.node())>>);

    Composer composer{Twice{alias}};
    REQUIRE(composer.compose_once().status == ComposeStatus::COMPOSED);
    REQUIRE(composer.to_string() == "Twice(Counted, Counted)");

    auto first{composer.scope_at(Position{}.child(0))};
    auto second{composer.scope_at(Position{}.child(1))};
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    REQUIRE(first != second);
    REQUIRE(first->element().same_node(second->element()));

    // Each slot keeps its own state even though both share the node
    REQUIRE(first->hook_count() == 1);
    REQUIRE(second->hook_count() == 1);

    // The tree keeps the node alive once the handles outside it have gone
    auto node{original.node()};
    original = Element{};
    alias = Element{};
    REQUIRE(node.use_count() >= 3);
    node.reset();
    REQUIRE(first->element().is<Counted>());
    REQUIRE(first->element().node().get() == second->element().node().get());
}
