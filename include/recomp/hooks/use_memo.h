#ifndef RECOMP_USE_MEMO_H
#define RECOMP_USE_MEMO_H

#include <recomp/types/hook.h>
#include <recomp/types/memoize.h>
#include <recomp/types/scope.h>

#include <type_traits>

namespace recomp {
    template<typename K, typename T>
    struct MemoHook final : Hook {
        MemoHook(K key_, T value_) : key{std::move(key_)}, value{std::move(value_)} {}

        K key;
        T value;
    };

    /**
     * A value computed by ``make_value()`` on the first composition and again whenever ``dependency`` differs
     * (as decided by Memoize<D>) from the one it was last computed for.
     */
    template<typename D, typename Make>
    const auto &use_memo(Scope &scope, const D &dependency, Make &&make_value) {
        using T = std::decay_t<std::invoke_result_t<Make &>>;
        using K = memo_key_t<D>;
        auto key{memo_key(dependency)};
        bool created{false};
        auto &hook{scope.use_hook<MemoHook<K, T>>([&] {
            created = true;
            return std::make_unique<MemoHook<K, T>>(key, make_value());
        })};
        if (!created && !(hook.key == key)) {
            hook.value = make_value();
            hook.key = std::move(key);
        }
        return hook.value;
    }
} // namespace recomp

#endif  // RECOMP_USE_MEMO_H
