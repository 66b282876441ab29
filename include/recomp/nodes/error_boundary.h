#ifndef RECOMP_ERROR_BOUNDARY_H
#define RECOMP_ERROR_BOUNDARY_H

#include <recomp/recomp_base.h>
#include <recomp/types/element.h>
#include <recomp/types/error_type.h>

#include <functional>
#include <optional>

namespace recomp {
    /**
     * The state an ErrorBoundary provides to its descendants, it is how the Composer finds the boundary a failure
     * belongs to.
     */
    struct RECOMP_EXPORT ErrorBoundaryState {
        using fallback_type = std::function<Element(const CompositionError &)>;
        using on_error_type = std::function<void(const CompositionError &)>;

        explicit ErrorBoundaryState(scope_ptr scope);

        [[nodiscard]] scope_ptr scope() const;

        /**
         * True while the boundary is showing its fallback.
         */
        [[nodiscard]] bool is_failed() const;

        [[nodiscard]] const std::optional<CompositionError> &error() const;

        /**
         * Record the failure and return the element to show in place of the content, empty when no fallback is set.
         */
        Element catch_error(const CompositionError &error);

        void reset();

        fallback_type fallback;
        on_error_type on_error;

    private:
        scope_ptr _scope;
        std::optional<CompositionError> _error;
    };

    /**
     * Composes ``content``. When a descendant fails to compose, the content is torn down and replaced by
     * ``fallback(error)`` (nothing if no fallback is given) until the boundary itself is recomposed, at which point
     * the content is tried again.
     *
     * Failures of the boundary itself, or of its fallback, go to the next boundary up.
     */
    struct RECOMP_EXPORT ErrorBoundary {
        static constexpr std::string_view name{"ErrorBoundary"};

        Element content;
        ErrorBoundaryState::fallback_type fallback{};
        ErrorBoundaryState::on_error_type on_error{};

        Children compose(Scope &scope) const;
    };
} // namespace recomp

#endif  // RECOMP_ERROR_BOUNDARY_H
