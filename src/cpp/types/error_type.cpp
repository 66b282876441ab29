#include <recomp/types/error_type.h>
#include <recomp/types/scope.h>

#include <utility>

namespace recomp {
    CompositionError::CompositionError(std::string scope_name_, std::string scope_path_, std::string position_,
                                       std::string error_msg_, std::string additional_context_)
        : scope_name(std::move(scope_name_)), scope_path(std::move(scope_path_)), position(std::move(position_)),
          error_msg(std::move(error_msg_)), additional_context(std::move(additional_context_)) {
    }

    std::string CompositionError::to_string() const {
        std::string result = scope_name;
        if (!scope_path.empty()) { result += " at " + scope_path; }
        if (!position.empty()) { result += " " + position; }
        if (!additional_context.empty()) { result += " :: " + additional_context; }
        result += "\nCompositionError: " + error_msg;
        return result;
    }

    CompositionError CompositionError::capture_error(const std::exception &e, const Scope &scope,
                                                     const std::string &msg) {
        // Already enriched closer to the failure, keep the original details
        if (auto *composition_err = dynamic_cast<const CompositionException *>(&e)) { return *composition_err; }
        return CompositionError(std::string{scope.name()}, scope.path(), scope.position().to_string(), e.what(), msg);
    }

    CompositionError CompositionError::capture_error(std::exception_ptr e, const Scope &scope,
                                                     const std::string &msg) {
        try {
            std::rethrow_exception(std::move(e));
        } catch (const std::exception &e_) {
            return CompositionError::capture_error(e_, scope, msg);
        } catch (...) {
            return CompositionError(std::string{scope.name()}, scope.path(), scope.position().to_string(),
                                    "Unknown non-standard exception during composition", msg);
        }
    }

    CompositionException::CompositionException(const CompositionError &error)
        : CompositionError(error), std::runtime_error(error.to_string()) {
    }

    CompositionException CompositionException::capture_error(const std::exception &e, const Scope &scope,
                                                             const std::string &msg) {
        return CompositionException(CompositionError::capture_error(e, scope, msg));
    }

    CompositionException CompositionException::capture_error(std::exception_ptr e, const Scope &scope,
                                                             const std::string &msg) {
        return CompositionException(CompositionError::capture_error(std::move(e), scope, msg));
    }

    std::ostream &operator<<(std::ostream &os, const CompositionError &error) { return os << error.to_string(); }
} // namespace recomp
