#ifndef RECOMP_ERROR_TYPE_H
#define RECOMP_ERROR_TYPE_H

#include <recomp/recomp_base.h>

#include <exception>
#include <ostream>
#include <stdexcept>

namespace recomp {
    /**
     * Raised by ``use_context`` when no ancestor provides the requested type. This is recoverable, the caller can
     * catch it (or use ``find_context``) and substitute a default.
     */
    struct RECOMP_EXPORT ContextError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A composable used its hook slots in a different order (or number) than on its previous composition.
     * This is a programmer error: it is never absorbed by an error boundary and propagates out of the Composer.
     */
    struct RECOMP_EXPORT HookOrderError : std::logic_error {
        using std::logic_error::logic_error;
    };

    /**
     * The description of a failure raised while composing a scope.
     */
    struct RECOMP_EXPORT CompositionError {
        std::string scope_name;
        std::string scope_path;
        std::string position;
        std::string error_msg;
        std::string additional_context;

        explicit CompositionError(std::string scope_name_ = "", std::string scope_path_ = "",
                                  std::string position_ = "", std::string error_msg_ = "",
                                  std::string additional_context_ = "");

        [[nodiscard]] std::string to_string() const;

        friend std::ostream &operator<<(std::ostream &os, const CompositionError &error);

        static CompositionError capture_error(const std::exception &e, const Scope &scope, const std::string &msg = "");

        static CompositionError capture_error(std::exception_ptr e, const Scope &scope, const std::string &msg = "");
    };

    struct RECOMP_EXPORT CompositionException : CompositionError, std::runtime_error {
        explicit CompositionException(const CompositionError &error);

        static CompositionException capture_error(const std::exception &e, const Scope &scope,
                                                  const std::string &msg = "");

        static CompositionException capture_error(std::exception_ptr e, const Scope &scope,
                                                  const std::string &msg = "");
    };
} // namespace recomp

#endif  // RECOMP_ERROR_TYPE_H
