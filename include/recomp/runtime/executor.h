#ifndef RECOMP_EXECUTOR_H
#define RECOMP_EXECUTOR_H

#include <recomp/recomp_base.h>

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>

namespace recomp {
    /**
     * Shared cancellation flag of a scope. Every task spawned from a scope holds the token, stopping the scope
     * cancels it. Safe to read from any thread.
     */
    struct RECOMP_EXPORT LifetimeToken {
        using s_ptr = std::shared_ptr<LifetimeToken>;

        void cancel() noexcept;

        [[nodiscard]] bool cancelled() const noexcept;

    private:
        std::atomic<bool> _cancelled{false};
    };

    /**
     * A unit of background work bound to the lifetime of a scope. Running a cancelled task is a no-op, long running
     * work should poll ``cancelled()`` and return early.
     */
    struct RECOMP_EXPORT Task {
        using work_type = std::function<void(const Task &)>;

        Task(LifetimeToken::s_ptr token, work_type work, std::string label = {});

        void operator()() const;

        [[nodiscard]] bool cancelled() const;

        [[nodiscard]] const std::string &label() const;

    private:
        LifetimeToken::s_ptr _token;
        work_type _work;
        std::string _label;
    };

    /**
     * The capability hosts supply to run background work. ``spawn`` may hand the task to any thread,
     * ``spawn_local`` must run it on the thread that calls ``poll``, which the Composer does at the end of
     * every pass.
     */
    struct RECOMP_EXPORT Executor {
        using ptr = Executor *;
        using s_ptr = std::shared_ptr<Executor>;

        virtual ~Executor() = default;

        virtual void spawn(Task task) = 0;

        virtual void spawn_local(Task task) = 0;

        /**
         * Run the work that is pinned to the calling thread, returns the number of tasks run.
         */
        virtual std::size_t poll() { return 0; }
    };

    /**
     * Current-thread executor, used when the host does not supply one. All work is queued and run by ``poll``.
     */
    struct RECOMP_EXPORT LocalExecutor : Executor {
        void spawn(Task task) override;

        void spawn_local(Task task) override;

        std::size_t poll() override;

        [[nodiscard]] std::size_t pending() const;

    private:
        mutable std::mutex _lock;
        std::deque<Task> _tasks;
    };
} // namespace recomp

#endif  // RECOMP_EXECUTOR_H
