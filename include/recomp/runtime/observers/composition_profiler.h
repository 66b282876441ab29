#ifndef RECOMP_COMPOSITION_PROFILER_H
#define RECOMP_COMPOSITION_PROFILER_H

#include <recomp/runtime/composer_observer.h>

#include <chrono>
#include <map>

namespace recomp {
    /**
     * Counts the compositions of each scope name and the time they took, optionally printing a summary at the end
     * of each pass. Useful to spot subtrees that recompose more often than expected.
     */
    struct RECOMP_EXPORT CompositionProfiler : CompositionLifeCycleObserver {
        using clock = std::chrono::steady_clock;

        struct Entry {
            std::size_t count{0};
            clock::duration elapsed{0};
        };

        explicit CompositionProfiler(bool print = false);

        void on_before_pass(const Composer &composer) override;

        void on_after_pass(const Composer &composer) override;

        void on_before_compose_scope(const Scope &scope) override;

        void on_after_compose_scope(const Scope &scope) override;

        /**
         * The number of compositions of scopes with the name since the last reset.
         */
        [[nodiscard]] std::size_t compose_count(std::string_view name) const;

        [[nodiscard]] std::size_t total_count() const;

        [[nodiscard]] std::size_t pass_count() const;

        [[nodiscard]] const std::map<std::string, Entry, std::less<>> &entries() const;

        void reset();

    private:
        void _print(const Composer &composer) const;

        bool _print_summary;
        std::map<std::string, Entry, std::less<>> _entries;
        std::size_t _passes{0};
        clock::time_point _compose_start{};
        clock::time_point _pass_start{};
    };
} // namespace recomp

#endif  // RECOMP_COMPOSITION_PROFILER_H
