#include <recomp/runtime/composer.h>
#include <recomp/runtime/observers/composition_trace.h>

namespace recomp {
    CompositionTrace::CompositionTrace(std::optional<std::string> filter, bool start, bool compose, bool stop,
                                       bool pass, sink_type sink)
        : _filter{std::move(filter)}, _start{start}, _compose{compose}, _stop{stop}, _pass{pass},
          _sink{std::move(sink)} {
    }

    void CompositionTrace::on_before_pass(const Composer &composer) {
        if (!_pass) { return; }
        _print(fmt::format("[{}] >> {} Pass {} {}", composer.config().label, std::string(15, '.'),
                           composer.pass_id(), std::string(15, '.')));
    }

    void CompositionTrace::on_after_pass(const Composer &composer) {
        if (!_pass) { return; }
        _print(fmt::format("[{}] << {} Pass {} done: {} {}", composer.config().label, std::string(15, '.'),
                           composer.pass_id(), composer.to_string(), std::string(15, '.')));
    }

    void CompositionTrace::on_start_scope(const Scope &scope) {
        if (_start && _should_log(scope)) { _print_scope(scope, "Started"); }
    }

    void CompositionTrace::on_before_compose_scope(const Scope &scope) {
        if (_compose && _should_log(scope)) {
            _print_scope(scope, scope.has_composed() ? "Recomposing" : "Composing");
        }
    }

    void CompositionTrace::on_after_compose_scope(const Scope &scope) {
        if (_compose && _should_log(scope)) {
            _print_scope(scope, fmt::format("Composed gen={} children={}", scope.generation(), scope.child_count()));
        }
    }

    void CompositionTrace::on_before_stop_scope(const Scope &scope) {
        if (_stop && _should_log(scope)) { _print_scope(scope, "Stopping"); }
    }

    void CompositionTrace::on_after_stop_scope(const Scope &scope) {
        if (_stop && _should_log(scope)) { _print_scope(scope, "Stopped"); }
    }

    void CompositionTrace::on_composition_error(const CompositionError &error, bool handled) {
        if (!_pass) { return; }
        if (_filter && error.scope_path.find(*_filter) == std::string::npos) { return; }
        _print(fmt::format("!! {} {}", handled ? "Handled" : "Unhandled", error.to_string()));
    }

    void CompositionTrace::_print(const std::string &msg) const {
        if (_sink) {
            _sink(msg);
        } else {
            fmt::print(stderr, "{}\n", msg);
        }
    }

    void CompositionTrace::_print_scope(const Scope &scope, std::string_view msg) const {
        _print(fmt::format("[{}] {} {}", scope.path(), scope.position(), msg));
    }

    bool CompositionTrace::_should_log(const Scope &scope) const {
        return !_filter.has_value() || scope.path().find(*_filter) != std::string::npos;
    }
} // namespace recomp
