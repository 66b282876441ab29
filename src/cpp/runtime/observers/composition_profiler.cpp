#include <recomp/runtime/composer.h>
#include <recomp/runtime/observers/composition_profiler.h>

namespace recomp {
    CompositionProfiler::CompositionProfiler(bool print) : _print_summary{print} {}

    void CompositionProfiler::on_before_pass(const Composer &) { _pass_start = clock::now(); }

    void CompositionProfiler::on_after_pass(const Composer &composer) {
        ++_passes;
        if (_print_summary) { _print(composer); }
    }

    void CompositionProfiler::on_before_compose_scope(const Scope &) { _compose_start = clock::now(); }

    void CompositionProfiler::on_after_compose_scope(const Scope &scope) {
        auto elapsed{clock::now() - _compose_start};
        auto it{_entries.find(scope.name())};
        if (it == _entries.end()) { it = _entries.emplace(std::string{scope.name()}, Entry{}).first; }
        ++it->second.count;
        it->second.elapsed += elapsed;
    }

    std::size_t CompositionProfiler::compose_count(std::string_view name) const {
        auto it{_entries.find(name)};
        return it == _entries.end() ? 0 : it->second.count;
    }

    std::size_t CompositionProfiler::total_count() const {
        std::size_t total{0};
        for (const auto &[name, entry]: _entries) { total += entry.count; }
        return total;
    }

    std::size_t CompositionProfiler::pass_count() const { return _passes; }

    const std::map<std::string, CompositionProfiler::Entry, std::less<>> &CompositionProfiler::entries() const {
        return _entries;
    }

    void CompositionProfiler::reset() {
        _entries.clear();
        _passes = 0;
    }

    void CompositionProfiler::_print(const Composer &composer) const {
        auto pass_us{std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - _pass_start).count()};
        fmt::print(stderr, "[{}] Pass {} took {}us\n", composer.config().label, composer.pass_id(), pass_us);
        for (const auto &[name, entry]: _entries) {
            fmt::print(stderr, "[{}]   {:<30} {:>8} {:>12}us\n", composer.config().label, name, entry.count,
                       std::chrono::duration_cast<std::chrono::microseconds>(entry.elapsed).count());
        }
    }
} // namespace recomp
