#include <recomp/runtime/dirty_scheduler.h>
#include <recomp/types/scope.h>

namespace recomp {
    bool DirtyScheduler::schedule(Scope &scope) { return _entries.insert(DirtyEntry{scope.position(), &scope}).second; }

    bool DirtyScheduler::unschedule(const Scope &scope) {
        auto it{_entries.find(DirtyEntry{scope.position(), nullptr})};
        // A different scope may have been created at the same position since, leave that one alone
        if (it == _entries.end() || it->scope != &scope) { return false; }
        _entries.erase(it);
        return true;
    }

    std::optional<DirtyEntry> DirtyScheduler::pop_first() {
        if (_entries.empty()) { return std::nullopt; }
        auto node{_entries.extract(_entries.begin())};
        return std::move(node.value());
    }

    bool DirtyScheduler::is_scheduled(const Scope &scope) const {
        auto it{_entries.find(DirtyEntry{scope.position(), nullptr})};
        return it != _entries.end() && it->scope == &scope;
    }

    std::size_t DirtyScheduler::size() const { return _entries.size(); }

    bool DirtyScheduler::empty() const { return _entries.empty(); }

    DirtyScheduler::const_iterator DirtyScheduler::begin() const { return _entries.begin(); }

    DirtyScheduler::const_iterator DirtyScheduler::end() const { return _entries.end(); }
} // namespace recomp
