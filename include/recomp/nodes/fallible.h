#ifndef RECOMP_FALLIBLE_H
#define RECOMP_FALLIBLE_H

#include <recomp/types/element.h>

#include <stdexcept>
#include <string>
#include <variant>

namespace recomp {
    /**
     * A composable that fails with ``message`` when composed. Also used to build a failed Fallible.
     */
    struct RECOMP_EXPORT Failure {
        static constexpr std::string_view name{"Failure"};

        std::string message;

        Children compose(Scope &) const { throw std::runtime_error(message); }
    };

    inline Failure fail(std::string message) { return Failure{std::move(message)}; }

    /**
     * Either a composable or a failure. Composing a failure raises a CompositionError for this scope, which is
     * handled by the nearest ErrorBoundary.
     *
     *     Fallible<Page> page = loaded ? Fallible<Page>{Page{...}} : fail("not loaded");
     */
    template<Composable T>
    struct Fallible {
        static constexpr std::string_view name{"Fallible"};

        Fallible(T value) : _value{std::move(value)} {}

        Fallible(Failure failure) : _value{std::move(failure)} {}

        [[nodiscard]] bool failed() const { return std::holds_alternative<Failure>(_value); }

        Children compose(Scope &scope) const {
            if (auto failure = std::get_if<Failure>(&_value)) { return failure->compose(scope); }
            return {Element{std::get<T>(_value)}};
        }

    private:
        std::variant<T, Failure> _value;
    };
} // namespace recomp

#endif  // RECOMP_FALLIBLE_H
