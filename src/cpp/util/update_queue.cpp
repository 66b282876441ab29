#include <recomp/util/update_queue.h>

#include <stdexcept>

namespace recomp {
    void UpdateQueue::set_wake_callback(std::function<void()> wake) {
        LockGuard guard(lock);
        wake_callback = std::move(wake);
    }

    void UpdateQueue::enqueue(value_type value) {
        if (!try_enqueue(std::move(value))) { throw std::runtime_error("Cannot enqueue into a stopped update queue"); }
    }

    bool UpdateQueue::try_enqueue(value_type value) {
        {
            LockGuard guard(lock);
            if (stopped()) { return false; }
            queue.push_back(std::move(value));
        }
        _wake();
        return true;
    }

    std::optional<UpdateQueue::value_type> UpdateQueue::dequeue() {
        LockGuard guard(lock);
        if (!queue.empty()) {
            auto value = std::move(queue.front());
            queue.pop_front();
            return value;
        }
        return std::nullopt;
    }

    std::size_t UpdateQueue::size() const {
        LockGuard guard(lock);
        return queue.size();
    }

    UpdateQueue::operator bool() const {
        LockGuard guard(lock);
        return !queue.empty();
    }

    bool UpdateQueue::stopped() const {
        LockGuard guard(lock);
        return _stopped;
    }

    void UpdateQueue::mark_stopped() {
        LockGuard guard(lock);
        _stopped = true;
        queue.clear();
    }

    void UpdateQueue::_wake() const {
        std::function<void()> wake;
        {
            LockGuard guard(lock);
            wake = wake_callback;
        }
        if (wake) { wake(); }
    }
} // namespace recomp
