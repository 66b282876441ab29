#ifndef RECOMP_UTIL_ROLLBACK_H
#define RECOMP_UTIL_ROLLBACK_H

#include <utility>

namespace recomp {
    /**
     * Runs an undo action when it goes out of scope, unless the work it guards was committed first.
     */
    template<class F>
    class Rollback {
    public:
        explicit Rollback(F &&undo) noexcept : _undo(std::move(undo)) {}

        Rollback(Rollback &&other) noexcept : _undo(std::move(other._undo)), _pending(other._pending) {
            other.commit();
        }

        Rollback(const Rollback &) = delete;

        Rollback &operator=(const Rollback &) = delete;

        Rollback &operator=(Rollback &&) = delete;

        ~Rollback() {
            if (_pending) { _undo(); }
        }

        void commit() noexcept { _pending = false; }

        [[nodiscard]] bool pending() const noexcept { return _pending; }

    private:
        F _undo;
        bool _pending{true};
    };

    template<class F>
    Rollback<F> make_rollback(F &&undo) { return Rollback<F>(std::forward<F>(undo)); }
} // namespace recomp
#endif  // RECOMP_UTIL_ROLLBACK_H
