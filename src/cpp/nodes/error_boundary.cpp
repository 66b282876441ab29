#include <recomp/hooks/use_context.h>
#include <recomp/nodes/error_boundary.h>
#include <recomp/types/scope.h>

namespace recomp {
    ErrorBoundaryState::ErrorBoundaryState(scope_ptr scope) : _scope{scope} {}

    scope_ptr ErrorBoundaryState::scope() const { return _scope; }

    bool ErrorBoundaryState::is_failed() const { return _error.has_value(); }

    const std::optional<CompositionError> &ErrorBoundaryState::error() const { return _error; }

    Element ErrorBoundaryState::catch_error(const CompositionError &error) {
        _error = error;
        if (on_error) { on_error(error); }
        return fallback ? fallback(error) : Element{};
    }

    void ErrorBoundaryState::reset() { _error.reset(); }

    Children ErrorBoundary::compose(Scope &scope) const {
        auto state{use_provider(scope, [&scope] { return ErrorBoundaryState{&scope}; })};
        state->fallback = fallback;
        state->on_error = on_error;
        auto retrying{state->is_failed()};
        state->reset();
        // The content never inherits the scopes the fallback was shown in
        if (retrying) { return Children::rebuild({content}); }
        return {content};
    }
} // namespace recomp
