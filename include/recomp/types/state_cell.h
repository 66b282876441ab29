#ifndef RECOMP_STATE_CELL_H
#define RECOMP_STATE_CELL_H

#include <recomp/recomp_base.h>
#include <recomp/types/hook.h>
#include <recomp/types/scope.h>
#include <recomp/util/update_queue.h>

#include <memory>

namespace recomp {
    /**
     * A single value owned by a scope, with a generation that is bumped on every write. The cell is only touched
     * on the composing thread, writes from elsewhere arrive through a Setter.
     */
    template<typename T>
    struct StateCell {
        using s_ptr = std::shared_ptr<StateCell>;

        StateCell(Scope::ptr owner, T value) : _owner{owner}, _value{std::move(value)} {}

        [[nodiscard]] const T &value() const { return _value; }

        [[nodiscard]] uint64_t generation() const { return _generation; }

        [[nodiscard]] Scope::ptr owner() const { return _owner; }

        void set(T value) {
            _value = std::move(value);
            _modified();
        }

        template<typename Fn>
        void update(Fn &&fn) {
            fn(_value);
            _modified();
        }

    private:
        void _modified() {
            ++_generation;
            _owner->mark_dirty();
        }

        Scope::ptr _owner;
        T _value;
        uint64_t _generation{0};
    };

    /**
     * Read-only view of a state cell. Valid for the composition step it was obtained in, hold on to a Setter (or a
     * context value) to reach the state later.
     */
    template<typename T>
    struct StateRef {
        explicit StateRef(const StateCell<T> &cell) : _cell{&cell} {}

        [[nodiscard]] const T &get() const { return _cell->value(); }

        const T &operator*() const { return _cell->value(); }

        const T *operator->() const { return &_cell->value(); }

        [[nodiscard]] uint64_t generation() const { return _cell->generation(); }

        /**
         * The identity of the underlying cell.
         */
        [[nodiscard]] const void *cell() const { return _cell; }

    private:
        const StateCell<T> *_cell;
    };

    /**
     * Writes to a state cell. Setters may be copied freely and called from any thread: the write is queued and
     * applied at the start of the next pass, at which point the owning scope is scheduled for recomposition.
     * Setters only hold weak references, once the owning scope has been destroyed (or the Composer has gone)
     * writes are dropped.
     */
    template<typename T>
    struct Setter {
        Setter() = default;

        Setter(std::weak_ptr<StateCell<T>> cell, std::weak_ptr<UpdateQueue> queue)
            : _cell{std::move(cell)}, _queue{std::move(queue)} {
        }

        /**
         * Returns false if the write could not be queued.
         */
        bool set(T value) const {
            auto queue{_queue.lock()};
            if (!queue) { return false; }
            // Held by pointer so move-only values fit in the queued function
            return queue->try_enqueue([cell = _cell, value = std::make_shared<T>(std::move(value))] {
                if (auto target = cell.lock()) { target->set(std::move(*value)); }
            });
        }

        bool operator()(T value) const { return set(std::move(value)); }

        /**
         * Queue an in-place modification, ``fn`` receives ``T &``.
         */
        template<typename Fn>
        bool update(Fn fn) const {
            auto queue{_queue.lock()};
            if (!queue) { return false; }
            return queue->try_enqueue([cell = _cell, fn = std::move(fn)] {
                if (auto target = cell.lock()) { target->update(fn); }
            });
        }

        /**
         * True while the owning scope exists.
         */
        [[nodiscard]] bool alive() const { return !_cell.expired(); }

    private:
        std::weak_ptr<StateCell<T>> _cell;
        std::weak_ptr<UpdateQueue> _queue;
    };

    template<typename T>
    struct StateHook final : Hook {
        explicit StateHook(typename StateCell<T>::s_ptr cell_) : cell{std::move(cell_)} {}

        typename StateCell<T>::s_ptr cell;
    };
} // namespace recomp

#endif  // RECOMP_STATE_CELL_H
