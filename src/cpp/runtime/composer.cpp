#include <recomp/nodes/error_boundary.h>
#include <recomp/runtime/composer.h>
#include <recomp/util/rollback.h>

#include <algorithm>
#include <stdexcept>

namespace recomp {
    bool ComposeResult::failed() const { return status == ComposeStatus::FAILED; }

    ComposeResult::operator bool() const { return status != ComposeStatus::FAILED; }

    struct Composer::NotifyScopeComposition {
        NotifyScopeComposition(Composer &composer, const Scope &scope) : _composer{composer}, _scope{scope} {
            _composer.notify_before_compose_scope(_scope);
        }

        ~NotifyScopeComposition() noexcept {
            try {
                _composer.notify_after_compose_scope(_scope);
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception during notify_after_compose_scope: {}\n", e.what());
            }
        }

    private:
        Composer &_composer;
        const Scope &_scope;
    };

    Composer::StepIterator::StepIterator(Composer::ptr composer, Scope::ptr current)
        : _composer{composer}, _current{current} {
    }

    Composer::StepIterator::reference Composer::StepIterator::operator*() const { return *_current; }

    Scope::ptr Composer::StepIterator::operator->() const { return _current; }

    Composer::StepIterator &Composer::StepIterator::operator++() {
        _current = _composer->step();
        return *this;
    }

    void Composer::StepIterator::operator++(int) { ++*this; }

    bool Composer::StepIterator::operator==(std::default_sentinel_t) const { return _current == nullptr; }

    Composer::StepRange::StepRange(Composer &composer) : _composer{composer} {}

    Composer::StepIterator Composer::StepRange::begin() { return StepIterator{&_composer, _composer.step()}; }

    std::default_sentinel_t Composer::StepRange::end() const { return {}; }

    Composer::Composer(Element root, ComposerConfig config)
        : _config{std::move(config)}, _updates{std::make_shared<UpdateQueue>()} {
        if (root.empty()) { throw std::invalid_argument("The root of a Composer cannot be an empty element"); }
        if (_config.executor == nullptr) { _config.executor = std::make_shared<LocalExecutor>(); }
        _life_cycle_observers = _config.observers;
        _root = create_scope(nullptr, Position{}, std::move(root));
        _scheduler.schedule(*_root);
    }

    Composer::~Composer() noexcept {
        // Setters that outlive the composer now drop their writes
        _updates->mark_stopped();
        try {
            destroy_scope(_root);
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception while disposing the composition tree: {}\n", e.what());
        }
    }

    ComposeResult Composer::compose_once() {
        ComposeResult result;
        auto resumed{_in_pass};
        try {
            while (step() != nullptr) { ++result.scopes_composed; }
        } catch (const CompositionException &e) {
            result.status = ComposeStatus::FAILED;
            result.error = static_cast<const CompositionError &>(e);
            return result;
        }
        result.status = result.scopes_composed > 0 || resumed ? ComposeStatus::COMPOSED : ComposeStatus::PENDING;
        return result;
    }

    Scope::ptr Composer::step() {
        if (!_in_pass && !begin_pass()) { return nullptr; }

        auto entry{_scheduler.pop_first()};
        if (!entry) {
            end_pass();
            return nullptr;
        }

        auto &scope{*entry->scope};
        try {
            compose_scope(scope);
            return &scope;
        } catch (const CompositionException &e) {
            CompositionError error{e};
            if (auto boundary = handle_error(scope, error)) { return boundary; }
            // Entries still pending stay scheduled for the next pass, the failed scope is not retried
            try {
                end_pass();
            } catch (const std::exception &inner) {
                fmt::print(stderr, "Warning: exception while completing a failed pass: {}\n", inner.what());
            }
            throw CompositionException(error);
        }
    }

    Composer::StepRange Composer::steps() { return StepRange{*this}; }

    std::size_t Composer::apply_updates() {
        if (_in_pass) { throw std::logic_error("State updates cannot be applied while a pass is in progress"); }
        // Writes queued by the updates themselves wait for the next pass
        auto pending{_updates->size()};
        std::size_t applied{0};
        for (; applied < pending; ++applied) {
            auto update{_updates->dequeue()};
            if (!update) { break; }
            (*update)();
        }
        return applied;
    }

    void Composer::schedule(Scope &scope) {
        if (_in_pass && scope.last_pass() == _pass_id) {
            _deferred.push_back(scope.position());
            return;
        }
        _scheduler.schedule(scope);
    }

    void Composer::queue_effect(const Scope &scope, std::function<void()> effect) {
        _pending_effects.push_back(PendingEffect{scope.lifetime(), &scope, std::move(effect)});
    }

    void Composer::set_wake_callback(std::function<void()> wake) { _updates->set_wake_callback(std::move(wake)); }

    std::shared_ptr<void> Composer::find_root_context(std::type_index type) const {
        auto it{_root_contexts.find(type)};
        return it == _root_contexts.end() ? nullptr : it->second;
    }

    void Composer::add_life_cycle_observer(CompositionLifeCycleObserver::s_ptr observer) {
        _life_cycle_observers.emplace_back(std::move(observer));
    }

    void Composer::remove_life_cycle_observer(CompositionLifeCycleObserver::ptr observer) {
        auto it{std::find_if(_life_cycle_observers.begin(), _life_cycle_observers.end(),
                             [observer](const auto &o) { return o.get() == observer; })};
        if (it != _life_cycle_observers.end()) { _life_cycle_observers.erase(it); }
    }

    Scope &Composer::root() const { return *_root; }

    Scope::ptr Composer::scope_at(const Position &position) const {
        Scope::ptr scope{_root.get()};
        for (auto index: position.path()) {
            if (scope == nullptr || index >= scope->_children.size()) { return nullptr; }
            scope = scope->_children[index].get();
        }
        return scope;
    }

    const DirtyScheduler &Composer::scheduler() const { return _scheduler; }

    const ComposerConfig &Composer::config() const { return _config; }

    const Executor::s_ptr &Composer::executor() const { return _config.executor; }

    const UpdateQueue::s_ptr &Composer::update_queue() const { return _updates; }

    uint64_t Composer::pass_id() const { return _pass_id; }

    bool Composer::in_pass() const { return _in_pass; }

    namespace {
        void dump_scope(const Scope &scope, std::string &out) {
            out += scope.name();
            bool first{true};
            for (std::size_t i = 0; i < scope.child_count(); ++i) {
                auto child{scope.child(i)};
                if (child == nullptr) { continue; }
                out += first ? "(" : ", ";
                first = false;
                dump_scope(*child, out);
            }
            if (!first) { out += ")"; }
        }
    } // namespace

    std::string Composer::to_string() const {
        std::string out;
        if (_root) { dump_scope(*_root, out); }
        return out;
    }

    std::ostream &operator<<(std::ostream &os, const Composer &composer) { return os << composer.to_string(); }

    bool Composer::begin_pass() {
        apply_updates();
        for (const auto &position: _deferred) {
            if (auto scope = scope_at(position)) { _scheduler.schedule(*scope); }
        }
        _deferred.clear();
        if (_scheduler.empty()) { return false; }

        ++_pass_id;
        _in_pass = true;
        notify_before_pass();
        return true;
    }

    void Composer::end_pass() {
        _in_pass = false;

        // Effects only ever observe the tree once all of the pass's mutations have been applied
        auto effects{std::move(_pending_effects)};
        _pending_effects.clear();
        std::exception_ptr first_exc;
        for (const auto &pending: effects) {
            auto lifetime{pending.lifetime.lock()};
            if (lifetime == nullptr || lifetime->cancelled()) { continue; }
            try {
                pending.effect();
            } catch (const std::exception &e) {
                if (!first_exc) {
                    first_exc = std::make_exception_ptr(
                        CompositionException::capture_error(e, *pending.scope, "During effect"));
                }
            } catch (...) {
                if (!first_exc) first_exc = std::current_exception();
            }
        }

        try {
            _config.executor->poll();
        } catch (...) {
            if (!first_exc) first_exc = std::current_exception();
        }

        try {
            notify_after_pass();
        } catch (...) {
            if (!first_exc) first_exc = std::current_exception();
        }
        if (first_exc) std::rethrow_exception(first_exc);
    }

    void Composer::compose_scope(Scope &scope) {
        NotifyScopeComposition nsc{*this, scope};
        Children children;
        try {
            auto effects_mark{_pending_effects.size()};
            auto rollback{make_rollback([&scope, this, effects_mark] {
                scope.rollback_compose();
                _pending_effects.resize(effects_mark);
            })};
            scope.begin_compose(_pass_id);
            children = scope.element().node()->compose(scope);
            scope.end_compose();
            rollback.commit();
        } catch (const HookOrderError &) {
            throw;
        } catch (const CompositionException &) {
            throw;  // already enriched
        } catch (const std::exception &e) {
            throw CompositionException::capture_error(e, scope, "During composition");
        } catch (...) {
            throw CompositionException::capture_error(std::current_exception(), scope,
                                                      "Unknown error during composition");
        }

        try {
            reconcile(scope, children);
        } catch (const CompositionException &) {
            throw;
        } catch (const std::exception &e) {
            throw CompositionException::capture_error(e, scope, "During reconciliation");
        } catch (...) {
            throw CompositionException::capture_error(std::current_exception(), scope,
                                                      "Unknown error during reconciliation");
        }
    }

    void Composer::reconcile(Scope &parent, const Children &children) {
        if (children.keeps_previous()) { return; }

        auto &slots{parent._children};
        std::exception_ptr first_exc;

        // Slots past the end of the new child list disappear, last first
        auto kept{children.rebuilds() ? std::size_t{0} : children.size()};
        while (slots.size() > kept) {
            try {
                destroy_scope(slots.back());
            } catch (...) {
                if (!first_exc) first_exc = std::current_exception();
            }
            slots.pop_back();
        }
        slots.resize(children.size());

        for (std::size_t i = 0; i < children.size(); ++i) {
            const auto &element{children[i]};
            auto &slot{slots[i]};

            if (slot != nullptr && !element.empty() && slot->element().type_id() == element.type_id()) {
                // Same type: keep the scope (and its state), recompose it with the new node. A shared node is
                // recomposed too, what it reads through contexts may have changed.
                if (!slot->element().same_node(element)) { slot->set_element(element); }
                schedule(*slot);
                continue;
            }

            if (slot != nullptr) {
                try {
                    destroy_scope(slot);
                } catch (...) {
                    if (!first_exc) first_exc = std::current_exception();
                }
            }
            if (element.empty()) { continue; }

            slot = create_scope(&parent, parent.position().child(static_cast<Position::index_type>(i)), element);
            schedule(*slot);
        }

        if (first_exc) std::rethrow_exception(first_exc);
    }

    Scope::u_ptr Composer::create_scope(Scope::ptr parent, Position position, Element element) {
        auto scope{std::make_unique<Scope>(*this, parent, std::move(position), std::move(element))};
        initialise_component(*scope);
        start_component(*scope);
        notify_start_scope(*scope);
        return scope;
    }

    void Composer::destroy_scope(Scope::u_ptr &slot) {
        if (slot == nullptr) { return; }
        Scope::u_ptr scope{std::move(slot)};
        std::exception_ptr first_exc;

        // Children go first, in reverse order of their slots
        auto &children{scope->_children};
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            try {
                destroy_scope(*it);
            } catch (...) {
                if (!first_exc) first_exc = std::current_exception();
            }
        }
        children.clear();

        _scheduler.unschedule(*scope);
        try {
            notify_before_stop_scope(*scope);
        } catch (...) {
            if (!first_exc) first_exc = std::current_exception();
        }
        try {
            stop_component(*scope);
        } catch (...) {
            if (!first_exc) first_exc = std::current_exception();
        }
        try {
            notify_after_stop_scope(*scope);
        } catch (...) {
            if (!first_exc) first_exc = std::current_exception();
        }
        dispose_component(*scope);
        scope.reset();

        if (first_exc) std::rethrow_exception(first_exc);
    }

    Scope::ptr Composer::handle_error(Scope &failed, CompositionError &error) {
        for (Scope::ptr from = &failed;;) {
            auto boundary_state{
                std::static_pointer_cast<ErrorBoundaryState>(from->find_context(typeid(ErrorBoundaryState)))
            };
            if (boundary_state == nullptr) {
                notify_composition_error(error, false);
                return nullptr;
            }
            auto &boundary{*boundary_state->scope()};
            if (boundary_state->is_failed()) {
                // Already showing its fallback, the failure came from the fallback itself
                from = &boundary;
                continue;
            }
            try {
                auto fallback{boundary_state->catch_error(error)};
                notify_composition_error(error, true);
                // The failed content is torn down completely before the fallback is built in its place
                reconcile(boundary, Children::rebuild(Children{std::move(fallback)}));
                return &boundary;
            } catch (const std::exception &e) {
                error = CompositionError::capture_error(e, boundary, "During error boundary fallback");
                from = &boundary;
            }
        }
    }

    void Composer::notify_before_pass() {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_before_pass(*this); }
    }

    void Composer::notify_after_pass() {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_after_pass(*this); }
    }

    void Composer::notify_start_scope(const Scope &scope) {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_start_scope(scope); }
    }

    void Composer::notify_before_compose_scope(const Scope &scope) {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_before_compose_scope(scope); }
    }

    void Composer::notify_after_compose_scope(const Scope &scope) {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_after_compose_scope(scope); }
    }

    void Composer::notify_before_stop_scope(const Scope &scope) {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_before_stop_scope(scope); }
    }

    void Composer::notify_after_stop_scope(const Scope &scope) {
        for (auto &life_cycle_observer: _life_cycle_observers) { life_cycle_observer->on_after_stop_scope(scope); }
    }

    void Composer::notify_composition_error(const CompositionError &error, bool handled) {
        for (auto &life_cycle_observer: _life_cycle_observers) {
            life_cycle_observer->on_composition_error(error, handled);
        }
    }
} // namespace recomp
