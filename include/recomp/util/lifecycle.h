#ifndef RECOMP_LIFECYCLE_H
#define RECOMP_LIFECYCLE_H

#include <recomp/recomp_base.h>

namespace recomp {
    struct ComponentLifeCycle;

    void RECOMP_EXPORT initialise_component(ComponentLifeCycle &component);

    void RECOMP_EXPORT start_component(ComponentLifeCycle &component);

    void RECOMP_EXPORT stop_component(ComponentLifeCycle &component);

    void RECOMP_EXPORT dispose_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * The Life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, additional properties may be set after this.
     *
     * * The component will have initialise called. For scopes this happens once the scope has been placed in the
     *   tree, before it is composed for the first time.
     *
     * * The start method is called prior to normal operation of the component. For scopes this is where the lifetime
     *   token that background work is bound to becomes live.
     *
     * * The stop method is called once normal operation is expected to cease. For scopes this cancels bound tasks and
     *   runs registered cleanup hooks. Children are always stopped before their parent.
     *
     * * The dispose method is called once the component is no longer required, in reverse creation order. A
     *   component that is still started is stopped first, and a disposed component can not be started again.
     *
     * NOTE: start and stop can be called numerous times during the life-time of the component. The code should ensure
     *       that it is able to start again cleanly after stop has been called. Stop is not dispose, full clean-up is
     *       only performed on dispose.
     */
    struct RECOMP_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        /**
         * The component is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        /**
         * The component is in the process of starting.
         */
        [[nodiscard]] bool is_starting() const;

        /**
         * The component is in the process of stopping.
         */
        [[nodiscard]] bool is_stopping() const;

        /**
         * The component has been disposed of.
         */
        [[nodiscard]] bool is_disposed() const;

    protected:
        /**
         * Called once the component has been constructed and prepared, never again.
         */
        virtual void initialise() = 0;

        /**
         * Perform any actions required to make the component live. It is the responsibility of the component to
         * delegate the start life-cycle call to contained life-cycle managed components it constructed.
         */
        virtual void start() = 0;

        /**
         * Halt the activities of the component. It is the responsibility of the component to delegate the stop
         * life-cycle call to contained life-cycle managed components it constructed.
         */
        virtual void stop() = 0;

        /**
         * Clean up any resources held. This is called once only at the end of the components life-cycle.
         */
        virtual void dispose() = 0;

    private:
        bool _started{false};
        bool _transitioning{false};
        bool _disposed{false};

        friend TransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace recomp

#endif  // RECOMP_LIFECYCLE_H
