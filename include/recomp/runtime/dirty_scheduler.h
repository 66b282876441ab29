#ifndef RECOMP_DIRTY_SCHEDULER_H
#define RECOMP_DIRTY_SCHEDULER_H

#include <recomp/recomp_base.h>
#include <recomp/types/position.h>

#include <set>

namespace recomp {
    struct RECOMP_EXPORT DirtyEntry {
        Position position;
        Scope *scope;

        auto operator<=>(const DirtyEntry &other) const { return position <=> other.position; }

        bool operator==(const DirtyEntry &other) const { return position == other.position; }
    };

    /**
     * The scopes pending recomposition, ordered by tree position so ancestors are always drained before their
     * descendants. Scheduling a scope that is already pending is a no-op.
     */
    struct RECOMP_EXPORT DirtyScheduler {
        using const_iterator = std::set<DirtyEntry>::const_iterator;

        /**
         * Returns true if the scope was not already pending.
         */
        bool schedule(Scope &scope);

        /**
         * Returns true if the scope was pending.
         */
        bool unschedule(const Scope &scope);

        /**
         * Remove and return the entry with the lowest position.
         */
        std::optional<DirtyEntry> pop_first();

        [[nodiscard]] bool is_scheduled(const Scope &scope) const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const;

        [[nodiscard]] const_iterator begin() const;

        [[nodiscard]] const_iterator end() const;

    private:
        std::set<DirtyEntry> _entries;
    };
} // namespace recomp

#endif  // RECOMP_DIRTY_SCHEDULER_H
