#include <recomp/runtime/executor.h>

#include <exception>

namespace recomp {
    void LifetimeToken::cancel() noexcept { _cancelled.store(true, std::memory_order_release); }

    bool LifetimeToken::cancelled() const noexcept { return _cancelled.load(std::memory_order_acquire); }

    Task::Task(LifetimeToken::s_ptr token, work_type work, std::string label)
        : _token{std::move(token)}, _work{std::move(work)}, _label{std::move(label)} {
    }

    void Task::operator()() const {
        if (cancelled() || !_work) { return; }
        _work(*this);
    }

    bool Task::cancelled() const { return _token == nullptr || _token->cancelled(); }

    const std::string &Task::label() const { return _label; }

    void LocalExecutor::spawn(Task task) { spawn_local(std::move(task)); }

    void LocalExecutor::spawn_local(Task task) {
        std::lock_guard<std::mutex> guard(_lock);
        _tasks.push_back(std::move(task));
    }

    std::size_t LocalExecutor::poll() {
        // Only run what was queued before the call, tasks spawned while polling wait for the next poll.
        std::deque<Task> tasks;
        {
            std::lock_guard<std::mutex> guard(_lock);
            tasks.swap(_tasks);
        }
        std::exception_ptr first_exc;
        for (const auto &task: tasks) {
            try {
                task();
            } catch (...) {
                if (!first_exc) first_exc = std::current_exception();
            }
        }
        if (first_exc) std::rethrow_exception(first_exc);
        return tasks.size();
    }

    std::size_t LocalExecutor::pending() const {
        std::lock_guard<std::mutex> guard(_lock);
        return _tasks.size();
    }
} // namespace recomp
