#ifndef RECOMP_USE_REF_H
#define RECOMP_USE_REF_H

#include <recomp/types/hook.h>
#include <recomp/types/scope.h>

#include <concepts>
#include <type_traits>

namespace recomp {
    template<typename T>
    struct RefHook final : Hook {
        explicit RefHook(T value_) : value{std::move(value_)} {}

        T value;
    };

    /**
     * A value that lives in the scope's slot for as long as the scope does. ``make_value`` is only called on the
     * first composition. Writing to the returned reference does not schedule the scope, use ``use_state`` for that.
     */
    template<typename Make>
        requires std::invocable<Make &>
    auto &use_ref(Scope &scope, Make &&make_value) {
        using T = std::decay_t<std::invoke_result_t<Make &>>;
        auto &hook{scope.use_hook<RefHook<T>>([&] { return std::make_unique<RefHook<T>>(make_value()); })};
        return hook.value;
    }

    template<typename T>
        requires (!std::invocable<T &>)
    T &use_ref(Scope &scope, T initial) {
        auto &hook{scope.use_hook<RefHook<T>>([&] { return std::make_unique<RefHook<T>>(std::move(initial)); })};
        return hook.value;
    }
} // namespace recomp

#endif  // RECOMP_USE_REF_H
