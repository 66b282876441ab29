#ifndef RECOMP_COMPOSITION_TRACE_H
#define RECOMP_COMPOSITION_TRACE_H

#include <recomp/runtime/composer_observer.h>

#include <functional>
#include <optional>

namespace recomp {
    /**
     * Logs the steps the Composer takes as it builds and updates the tree.
     *
     * This is voluminous but can be helpful tracing down unexpected recompositions.
     */
    struct RECOMP_EXPORT CompositionTrace : CompositionLifeCycleObserver {
        using sink_type = std::function<void(const std::string &)>;

        /**
         * @param filter Only report scopes whose path contains the filter
         * @param start Log scope start events
         * @param compose Log scope compose events
         * @param stop Log scope stop events
         * @param pass Log pass begin / end and errors
         * @param sink Receives each line, stderr when not set
         */
        explicit CompositionTrace(std::optional<std::string> filter = std::nullopt, bool start = true,
                                  bool compose = true, bool stop = true, bool pass = true, sink_type sink = {});

        void on_before_pass(const Composer &composer) override;

        void on_after_pass(const Composer &composer) override;

        void on_start_scope(const Scope &scope) override;

        void on_before_compose_scope(const Scope &scope) override;

        void on_after_compose_scope(const Scope &scope) override;

        void on_before_stop_scope(const Scope &scope) override;

        void on_after_stop_scope(const Scope &scope) override;

        void on_composition_error(const CompositionError &error, bool handled) override;

    private:
        void _print(const std::string &msg) const;

        void _print_scope(const Scope &scope, std::string_view msg) const;

        [[nodiscard]] bool _should_log(const Scope &scope) const;

        std::optional<std::string> _filter;
        bool _start;
        bool _compose;
        bool _stop;
        bool _pass;
        sink_type _sink;
    };
} // namespace recomp

#endif  // RECOMP_COMPOSITION_TRACE_H
