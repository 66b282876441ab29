#ifndef RECOMP_ELEMENT_H
#define RECOMP_ELEMENT_H

#include <recomp/recomp_base.h>
#include <recomp/util/string_utils.h>

#include <concepts>
#include <initializer_list>
#include <memory>
#include <optional>
#include <typeindex>
#include <type_traits>

namespace recomp {
    /**
     * The type-erased interface to a composable node. Nodes are immutable once built and are only ever reached
     * through ``std::shared_ptr<const AnyCompose>``, so any number of handles may share one node but none of them
     * can mutate it. A scope keeps the node it was composed from alive for as long as the scope exists, independently
     * of the parent value the node came from.
     */
    struct RECOMP_EXPORT AnyCompose {
        using s_ptr = std::shared_ptr<const AnyCompose>;

        virtual ~AnyCompose() = default;

        [[nodiscard]] virtual std::type_index type_id() const = 0;

        [[nodiscard]] virtual std::string_view name() const = 0;

        virtual Children compose(Scope &scope) const = 0;
    };

    /**
     * A composable is any copyable value that, given its scope, produces its children.
     */
    template<typename T>
    concept Composable = std::copy_constructible<T> && requires(const T &t, Scope &scope) {
        { t.compose(scope) } -> std::convertible_to<Children>;
    };

    template<typename T>
    concept NamedComposable = requires { std::string_view{T::name}; };

    /**
     * The name a composable type is shown with in the tree dump and in errors.
     */
    template<typename T>
    std::string_view compose_name() {
        if constexpr (NamedComposable<T>) {
            return std::string_view{T::name};
        } else {
            static const std::string name_{short_type_name(typeid(T))};
            return name_;
        }
    }

    template<typename T>
    struct ComposeModel final : AnyCompose {
        explicit ComposeModel(T value_) : value{std::move(value_)} {}

        [[nodiscard]] std::type_index type_id() const override { return typeid(T); }

        [[nodiscard]] std::string_view name() const override { return compose_name<T>(); }

        Children compose(Scope &scope) const override;

        const T value;
    };

    /**
     * A dynamic node: holds any composable behind its runtime type identity. This is what child lists are made of,
     * so children of different concrete types can sit side by side. When a slot holds an element of the same type
     * identity on two consecutive compositions the existing scope (and its state) is kept, otherwise the old scope
     * is destroyed and a fresh one built.
     *
     * An empty element occupies a child slot without allocating a scope.
     */
    struct RECOMP_EXPORT Element {
        Element() = default;

        template<typename T>
            requires (!std::same_as<std::decay_t<T>, Element> && !std::same_as<std::decay_t<T>, Children> &&
                      Composable<std::decay_t<T>>)
        Element(T &&value)
            : _node{std::make_shared<const ComposeModel<std::decay_t<T>>>(std::forward<T>(value))} {
        }

        template<Composable T>
        Element(std::optional<T> value) {
            if (value) { _node = std::make_shared<const ComposeModel<T>>(std::move(*value)); }
        }

        explicit Element(AnyCompose::s_ptr node);

        [[nodiscard]] bool empty() const;

        explicit operator bool() const;

        /**
         * The runtime type identity, ``typeid(void)`` for an empty element.
         */
        [[nodiscard]] std::type_index type_id() const;

        [[nodiscard]] std::string_view name() const;

        [[nodiscard]] const AnyCompose::s_ptr &node() const;

        /**
         * True when both elements share the same underlying node.
         */
        [[nodiscard]] bool same_node(const Element &other) const;

        /**
         * Access to the concrete value if the element holds a ``T``, nullptr otherwise.
         */
        template<typename T>
        [[nodiscard]] const T *get() const {
            auto model = dynamic_cast<const ComposeModel<T> *>(_node.get());
            return model == nullptr ? nullptr : &model->value;
        }

        template<typename T>
        [[nodiscard]] bool is() const { return type_id() == std::type_index{typeid(T)}; }

    private:
        AnyCompose::s_ptr _node;
    };

    /**
     * The empty element, keeps a child slot without building a scope for it.
     */
    inline const Element nothing{};

    /**
     * Wrap a composable as a dynamic node.
     */
    template<Composable T>
    Element dyn_compose(T value) { return Element{std::move(value)}; }

    /**
     * The ordered child list a composable produces. Children are matched to the previous composition by slot
     * index. The special ``keep()`` value leaves the existing children untouched, it is how memoization skips
     * a subtree. A child keeping its slot and type is recomposed whenever its parent is.
     */
    struct RECOMP_EXPORT Children {
        using value_type = Element;
        using const_iterator = std::vector<Element>::const_iterator;

        Children() = default;

        Children(std::initializer_list<Element> elements);

        Children(std::vector<Element> elements);

        Children(Element element);

        template<typename T>
            requires (!std::same_as<std::decay_t<T>, Children> && !std::same_as<std::decay_t<T>, Element> &&
                      Composable<std::decay_t<T>>)
        Children(T &&value) : _elements{Element{std::forward<T>(value)}} {
        }

        static Children keep();

        /**
         * The given children built in fresh scopes, the existing children are all destroyed first even where the
         * types match.
         */
        static Children rebuild(Children children);

        [[nodiscard]] bool keeps_previous() const;

        [[nodiscard]] bool rebuilds() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const;

        [[nodiscard]] const Element &operator[](std::size_t index) const;

        [[nodiscard]] const_iterator begin() const;

        [[nodiscard]] const_iterator end() const;

        void push_back(Element element);

    private:
        std::vector<Element> _elements;
        bool _keep{false};
        bool _rebuild{false};
    };

    template<typename T>
    Children ComposeModel<T>::compose(Scope &scope) const {
        return Children(value.compose(scope));
    }
} // namespace recomp

#endif  // RECOMP_ELEMENT_H
