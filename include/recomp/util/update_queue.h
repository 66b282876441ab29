#ifndef RECOMP_UPDATE_QUEUE_H
#define RECOMP_UPDATE_QUEUE_H

#include <recomp/recomp_base.h>

#include <deque>
#include <functional>
#include <mutex>

namespace recomp {
    /**
     * Hand-off point for state writes. Setters may be called from any thread (typically a task running on a
     * host executor); the write is captured as a closure and queued here. The Composer drains the queue on the
     * composing thread at the start of the next pass, so state cells are only ever touched by that thread.
     */
    struct RECOMP_EXPORT UpdateQueue {
        using ptr = UpdateQueue *;
        using s_ptr = std::shared_ptr<UpdateQueue>;
        using LockType = std::recursive_mutex;
        using LockGuard = std::lock_guard<LockType>;
        using value_type = std::function<void()>;

        UpdateQueue() = default;

        /**
         * Called (outside the lock) every time a value is enqueued, a host loop uses this to request a pass.
         */
        void set_wake_callback(std::function<void()> wake);

        /**
         * Throws if the queue has been stopped.
         */
        void enqueue(value_type value);

        /**
         * Returns false, dropping the value, if the queue has been stopped.
         */
        bool try_enqueue(value_type value);

        std::optional<value_type> dequeue();

        [[nodiscard]] std::size_t size() const;

        explicit operator bool() const;

        [[nodiscard]] bool stopped() const;

        void mark_stopped();

    private:
        void _wake() const;

        mutable LockType lock;
        std::deque<value_type> queue;
        std::function<void()> wake_callback{};
        bool _stopped{false};
    };
} // namespace recomp

#endif  // RECOMP_UPDATE_QUEUE_H
