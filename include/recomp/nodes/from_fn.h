#ifndef RECOMP_FROM_FN_H
#define RECOMP_FROM_FN_H

#include <recomp/types/element.h>

#include <concepts>
#include <type_traits>

namespace recomp {
    /**
     * A composable made from a function of the scope, the function returns anything convertible to Children.
     * Every FromFn has its own type identity per function type, so two lambdas never share state.
     */
    template<typename Fn>
    struct FromFn {
        static constexpr std::string_view name{"FromFn"};

        Fn fn;

        Children compose(Scope &scope) const { return Children(fn(scope)); }
    };

    template<typename Fn>
        requires std::copy_constructible<std::decay_t<Fn>>
    FromFn<std::decay_t<Fn>> from_fn(Fn &&fn) {
        return FromFn<std::decay_t<Fn>>{std::forward<Fn>(fn)};
    }
} // namespace recomp

#endif  // RECOMP_FROM_FN_H
