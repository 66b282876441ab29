#ifndef RECOMP_COMPOSER_H
#define RECOMP_COMPOSER_H

#include <recomp/recomp_base.h>
#include <recomp/runtime/composer_observer.h>
#include <recomp/runtime/dirty_scheduler.h>
#include <recomp/runtime/executor.h>
#include <recomp/types/element.h>
#include <recomp/types/error_type.h>
#include <recomp/types/scope.h>
#include <recomp/util/update_queue.h>

#include <iterator>
#include <ostream>
#include <typeindex>
#include <unordered_map>

namespace recomp {
    enum class HookCheck { ENABLED = 0, DISABLED = 1 };

    enum class ComposeStatus { COMPOSED = 0, PENDING = 1, FAILED = 2 };

    constexpr HookCheck default_hook_check() {
#ifdef NDEBUG
        return HookCheck::DISABLED;
#else
        return HookCheck::ENABLED;
#endif
    }

    struct RECOMP_EXPORT ComposerConfig {
        /**
         * Shown by the trace and profiler observers.
         */
        std::string label{};

        /**
         * Whether a change in the number of hooks a scope uses between compositions raises a HookOrderError.
         * A change in hook type at a slot is always raised.
         */
        HookCheck hook_check{default_hook_check()};

        /**
         * Runs the work registered with use_task and use_local_task, a LocalExecutor is used when not set.
         */
        Executor::s_ptr executor{};

        std::vector<CompositionLifeCycleObserver::s_ptr> observers{};
    };

    struct RECOMP_EXPORT ComposeResult {
        ComposeStatus status{ComposeStatus::PENDING};
        std::optional<CompositionError> error{};
        std::size_t scopes_composed{0};

        [[nodiscard]] bool failed() const;

        explicit operator bool() const;
    };

    /**
     * Owns the tree of scopes for one root composable and drives the composition passes.
     *
     * The first pass composes the whole tree. After that only scopes that were marked dirty (because a state cell
     * they own was written, or because their parent produced a new node for their slot) are recomposed, in
     * position order so a parent is always recomposed before any of its descendants and no scope is composed twice
     * in one pass.
     *
     * A pass can be driven to completion with ``compose_once``, or one scope at a time with ``step`` / ``steps``.
     */
    struct RECOMP_EXPORT Composer {
        using ptr = Composer *;

        struct RECOMP_EXPORT StepIterator {
            using value_type = Scope;
            using difference_type = std::ptrdiff_t;
            using reference = Scope &;
            using iterator_concept = std::input_iterator_tag;

            StepIterator() = default;

            StepIterator(Composer::ptr composer, Scope::ptr current);

            reference operator*() const;

            Scope::ptr operator->() const;

            StepIterator &operator++();

            void operator++(int);

            bool operator==(std::default_sentinel_t) const;

        private:
            Composer::ptr _composer{nullptr};
            Scope::ptr _current{nullptr};
        };

        struct RECOMP_EXPORT StepRange {
            explicit StepRange(Composer &composer);

            StepIterator begin();

            [[nodiscard]] std::default_sentinel_t end() const;

        private:
            Composer &_composer;
        };

        explicit Composer(Element root, ComposerConfig config = {});

        ~Composer() noexcept;

        Composer(const Composer &) = delete;

        Composer &operator=(const Composer &) = delete;

        /**
         * Run a full pass. Returns PENDING when there was nothing to compose, FAILED (with the error) when a
         * composition failure was not absorbed by an error boundary, COMPOSED otherwise. A HookOrderError is
         * thrown rather than reported.
         *
         * If a step-wise pass is in progress it is completed.
         */
        ComposeResult compose_once();

        /**
         * Compose the next pending scope and return it. When nothing is left the pass is completed (effects and
         * local tasks are run) and nullptr is returned. A composition failure that is not absorbed by an error
         * boundary ends the pass and is thrown as a CompositionException.
         */
        Scope::ptr step();

        /**
         * ``step`` as an input range: ``for (auto &scope : composer.steps()) {...}``
         */
        StepRange steps();

        /**
         * Apply the state writes queued since the last pass, scheduling the scopes that own them. This is done at
         * the start of every pass, hosts only need it to inspect the scheduler. Returns the number of writes applied.
         */
        std::size_t apply_updates();

        /**
         * Schedule a scope for recomposition. A scope that was already composed in the current pass is deferred to
         * the next pass.
         */
        void schedule(Scope &scope);

        /**
         * Run ``effect`` once the current pass has completed, provided the scope has not been stopped by then.
         */
        void queue_effect(const Scope &scope, std::function<void()> effect);

        void set_wake_callback(std::function<void()> wake);

        template<typename T>
        void provide_context(std::shared_ptr<T> value) {
            _root_contexts[std::type_index{typeid(T)}] = std::move(value);
        }

        [[nodiscard]] std::shared_ptr<void> find_root_context(std::type_index type) const;

        void add_life_cycle_observer(CompositionLifeCycleObserver::s_ptr observer);

        void remove_life_cycle_observer(CompositionLifeCycleObserver::ptr observer);

        [[nodiscard]] Scope &root() const;

        /**
         * The scope at the position, nullptr if there is none.
         */
        [[nodiscard]] Scope::ptr scope_at(const Position &position) const;

        [[nodiscard]] const DirtyScheduler &scheduler() const;

        [[nodiscard]] const ComposerConfig &config() const;

        [[nodiscard]] const Executor::s_ptr &executor() const;

        [[nodiscard]] const UpdateQueue::s_ptr &update_queue() const;

        /**
         * The id of the current (or last) pass, passes that had nothing to compose are not counted.
         */
        [[nodiscard]] uint64_t pass_id() const;

        [[nodiscard]] bool in_pass() const;

        /**
         * The tree dump, i.e. ``App(Header, List(Item, Item))``. Empty slots are not shown.
         */
        [[nodiscard]] std::string to_string() const;

        friend std::ostream &operator<<(std::ostream &os, const Composer &composer);

    private:
        struct PendingEffect {
            std::weak_ptr<LifetimeToken> lifetime;
            const Scope *scope;
            std::function<void()> effect;
        };

        struct NotifyScopeComposition;

        bool begin_pass();

        void end_pass();

        void compose_scope(Scope &scope);

        void reconcile(Scope &parent, const Children &children);

        Scope::u_ptr create_scope(Scope::ptr parent, Position position, Element element);

        void destroy_scope(Scope::u_ptr &slot);

        /**
         * Hand the failure to the nearest error boundary above the failed scope that is not already showing its
         * fallback. Returns the boundary scope, or nullptr if no boundary took it. ``error`` is updated when a
         * fallback itself fails.
         */
        Scope::ptr handle_error(Scope &failed, CompositionError &error);

        void notify_before_pass();

        void notify_after_pass();

        void notify_start_scope(const Scope &scope);

        void notify_before_compose_scope(const Scope &scope);

        void notify_after_compose_scope(const Scope &scope);

        void notify_before_stop_scope(const Scope &scope);

        void notify_after_stop_scope(const Scope &scope);

        void notify_composition_error(const CompositionError &error, bool handled);

        ComposerConfig _config;
        UpdateQueue::s_ptr _updates;
        DirtyScheduler _scheduler;
        std::vector<PendingEffect> _pending_effects;
        std::vector<Position> _deferred;
        std::unordered_map<std::type_index, std::shared_ptr<void>> _root_contexts;
        std::vector<CompositionLifeCycleObserver::s_ptr> _life_cycle_observers;
        uint64_t _pass_id{0};
        bool _in_pass{false};
        Scope::u_ptr _root;
    };
} // namespace recomp

template<>
struct fmt::formatter<recomp::Composer> : fmt::formatter<std::string_view> {
    auto format(const recomp::Composer &composer, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(composer.to_string(), ctx);
    }
};

#endif  // RECOMP_COMPOSER_H
