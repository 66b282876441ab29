#ifndef RECOMP_SCOPE_H
#define RECOMP_SCOPE_H

#include <recomp/recomp_base.h>
#include <recomp/runtime/executor.h>
#include <recomp/types/element.h>
#include <recomp/types/hook.h>
#include <recomp/types/position.h>
#include <recomp/util/lifecycle.h>

#include <typeindex>
#include <typeinfo>
#include <utility>

namespace recomp {
    /**
     * The persistent record attached to one composable instance in the tree. A scope is created the first time a
     * node is composed at a position, reused while the node at that position keeps the same type, and destroyed when
     * the position disappears or the type changes.
     *
     * Hooks (state cells, memo slots, effects, tasks, providers) live in an ordered list of slots which must be
     * accessed in the same order on every composition of the scope.
     */
    struct RECOMP_EXPORT Scope final : ComponentLifeCycle {
        using ptr = Scope *;
        using u_ptr = std::unique_ptr<Scope>;

        Scope(Composer &composer, ptr parent, Position position, Element element);

        Scope(const Scope &) = delete;

        Scope &operator=(const Scope &) = delete;

        [[nodiscard]] Composer &composer() const;

        [[nodiscard]] ptr parent() const;

        [[nodiscard]] const Position &position() const;

        [[nodiscard]] const Element &element() const;

        [[nodiscard]] std::string_view name() const;

        /**
         * The names of the scopes from the root to this one, i.e. ``App/List/Item``.
         */
        [[nodiscard]] std::string path() const;

        /**
         * The number of completed compositions of this scope.
         */
        [[nodiscard]] uint64_t generation() const;

        [[nodiscard]] bool has_composed() const;

        /**
         * The id of the last pass this scope was composed in, 0 if never.
         */
        [[nodiscard]] uint64_t last_pass() const;

        /**
         * The number of child slots, empty slots included.
         */
        [[nodiscard]] std::size_t child_count() const;

        /**
         * The child scope at the slot, nullptr for an empty slot.
         */
        [[nodiscard]] ptr child(std::size_t index) const;

        [[nodiscard]] std::size_t hook_count() const;

        [[nodiscard]] const LifetimeToken::s_ptr &lifetime() const;

        /**
         * Request this scope be recomposed, in this pass if it has not yet been composed in it, otherwise in the next.
         */
        void mark_dirty();

        /**
         * Returns the hook in the next slot, creating it with ``make`` (returning ``std::unique_ptr<H>``) when the
         * slot does not exist yet. Throws HookOrderError if the slot holds a different hook type, or a new slot is
         * requested after the first composition while hook checks are enabled.
         */
        template<typename H, typename Make>
        H &use_hook(Make &&make) {
            auto slot{_hook_idx++};
            if (slot < _hooks.size()) {
                auto &hook{*_hooks[slot]};
                if (typeid(hook) != typeid(H)) { _hook_type_mismatch(slot, typeid(H)); }
                return static_cast<H &>(hook);
            }
            if (has_composed() && _hook_check_enabled()) { _hook_added(slot, typeid(H)); }
            std::unique_ptr<H> hook{make()};
            auto &result{*hook};
            _hooks.emplace_back(std::move(hook));
            return result;
        }

        /**
         * Make a value visible to the descendants of this scope (not to the scope itself).
         */
        void provide_context(std::type_index type, std::shared_ptr<void> value);

        /**
         * The value of the nearest ancestor providing the type, falling back to the values provided on the
         * Composer. Returns nullptr when none is found.
         */
        [[nodiscard]] std::shared_ptr<void> find_context(std::type_index type) const;

    protected:
        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        friend Composer;

        void set_element(Element element);

        void begin_compose(uint64_t pass_id);

        void end_compose();

        void rollback_compose();

        [[nodiscard]] bool _hook_check_enabled() const;

        [[noreturn]] void _hook_type_mismatch(std::size_t slot, const std::type_info &requested) const;

        [[noreturn]] void _hook_added(std::size_t slot, const std::type_info &requested) const;

        Composer &_composer;
        ptr _parent;
        Position _position;
        Element _element;

        std::vector<Hook::u_ptr> _hooks;
        std::size_t _hook_idx{0};
        std::size_t _committed_hooks{0};

        std::vector<std::pair<std::type_index, std::shared_ptr<void>>> _provided;
        std::size_t _committed_provided{0};

        std::vector<u_ptr> _children;
        LifetimeToken::s_ptr _lifetime;

        uint64_t _generation{0};
        uint64_t _last_pass{0};
    };
} // namespace recomp

#endif  // RECOMP_SCOPE_H
