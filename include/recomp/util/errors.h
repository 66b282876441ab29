#ifndef RECOMP_UTIL_ERRORS_H
#define RECOMP_UTIL_ERRORS_H

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <utility>

namespace recomp {
    /**
     * Format the message and throw it as an ``Error``. Any error type constructible from a message string works,
     * e.g. ``throw_error<ContextError>("Context value not found for type: {}", name)``.
     */
    template<typename Error = std::runtime_error, typename... Ts>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }
} // namespace recomp

#endif // RECOMP_UTIL_ERRORS_H
