#ifndef RECOMP_USE_STATE_H
#define RECOMP_USE_STATE_H

#include <recomp/runtime/composer.h>
#include <recomp/types/state_cell.h>

#include <concepts>
#include <type_traits>
#include <utility>

namespace recomp {
    /**
     * Use a state cell owned by the scope. The cell is created with ``make_value()`` on the first composition.
     *
     * The StateRef reads the current value, the Setter queues a write which is applied at the start of the next pass
     * and schedules this scope (never a synchronous recomposition).
     */
    template<typename Make>
        requires std::invocable<Make &>
    auto use_state(Scope &scope, Make &&make_value) {
        using T = std::decay_t<std::invoke_result_t<Make &>>;
        auto &hook{scope.use_hook<StateHook<T>>([&] {
            return std::make_unique<StateHook<T>>(std::make_shared<StateCell<T>>(&scope, make_value()));
        })};
        return std::pair<StateRef<T>, Setter<T>>{StateRef<T>{*hook.cell},
                                                 Setter<T>{hook.cell, scope.composer().update_queue()}};
    }

    template<typename T>
        requires (!std::invocable<T &>)
    std::pair<StateRef<T>, Setter<T>> use_state(Scope &scope, T initial) {
        return use_state(scope, [&initial] { return std::move(initial); });
    }
} // namespace recomp

#endif  // RECOMP_USE_STATE_H
