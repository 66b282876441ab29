#include <recomp/util/lifecycle.h>

#include <stdexcept>

namespace recomp {
    bool ComponentLifeCycle::is_started() const { return _started; }

    bool ComponentLifeCycle::is_starting() const { return _transitioning && !_started; }

    bool ComponentLifeCycle::is_stopping() const { return _transitioning && _started; }

    bool ComponentLifeCycle::is_disposed() const { return _disposed; }

    // Marks the component as mid-transition for as long as the start or stop call runs
    struct TransitionGuard {
        explicit TransitionGuard(ComponentLifeCycle &component) : _component{component} {
            _component._transitioning = true;
        }

        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    void initialise_component(ComponentLifeCycle &component) {
        if (component._disposed) { throw std::logic_error("Cannot initialise a component that has been disposed"); }
        component.initialise();
    }

    // Life-cycle calls are made on the composing thread only, re-entrant calls during a transition are ignored.

    void start_component(ComponentLifeCycle &component) {
        if (component._disposed) { throw std::logic_error("Cannot start a component that has been disposed"); }
        if (component._started || component._transitioning) { return; }
        TransitionGuard guard{component};
        component.start();
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component._started || component._transitioning) { return; }
        TransitionGuard guard{component};
        component.stop();
        component._started = false;
    }

    void dispose_component(ComponentLifeCycle &component) {
        if (component._disposed) { return; }
        stop_component(component);
        component._disposed = true;
        component.dispose();
    }
} // namespace recomp
