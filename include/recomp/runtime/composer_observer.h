#ifndef RECOMP_COMPOSER_OBSERVER_H
#define RECOMP_COMPOSER_OBSERVER_H

#include <recomp/recomp_base.h>

namespace recomp {
    /**
     * Receives the life-cycle events of a Composer. All calls are made on the composing thread.
     */
    struct CompositionLifeCycleObserver {
        using ptr = CompositionLifeCycleObserver *;
        using s_ptr = std::shared_ptr<CompositionLifeCycleObserver>;

        virtual ~CompositionLifeCycleObserver() = default;

        virtual void on_before_pass(const Composer &) {
        };

        virtual void on_after_pass(const Composer &) {
        };

        virtual void on_start_scope(const Scope &) {
        };

        virtual void on_before_compose_scope(const Scope &) {
        };

        virtual void on_after_compose_scope(const Scope &) {
        };

        virtual void on_before_stop_scope(const Scope &) {
        };

        virtual void on_after_stop_scope(const Scope &) {
        };

        /**
         * A composition failure, ``handled`` is true when an error boundary absorbed it.
         */
        virtual void on_composition_error(const CompositionError &, bool /*handled*/) {
        };
    };
} // namespace recomp

#endif  // RECOMP_COMPOSER_OBSERVER_H
