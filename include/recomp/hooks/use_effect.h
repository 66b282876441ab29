#ifndef RECOMP_USE_EFFECT_H
#define RECOMP_USE_EFFECT_H

#include <recomp/runtime/composer.h>
#include <recomp/types/hook.h>
#include <recomp/types/memoize.h>

#include <functional>
#include <optional>

namespace recomp {
    template<typename K>
    struct EffectHook final : Hook {
        std::optional<K> last;
    };

    /**
     * Run ``effect()`` once the current pass has completed, on the first composition and whenever ``dependency``
     * changes. The effect does not run if the scope is destroyed before the pass completes, or if the composition
     * that queued it fails.
     */
    template<typename D, typename Fn>
    void use_effect(Scope &scope, const D &dependency, Fn effect) {
        using K = memo_key_t<D>;
        auto &hook{scope.use_hook<EffectHook<K>>([] { return std::make_unique<EffectHook<K>>(); })};
        auto key{memo_key(dependency)};
        if (hook.last && *hook.last == key) { return; }
        // The key is only recorded once the effect has run, a rolled back composition queues it again next time
        scope.composer().queue_effect(scope, [&hook, key = std::move(key), effect = std::move(effect)]() mutable {
            hook.last = std::move(key);
            effect();
        });
    }
} // namespace recomp

#endif  // RECOMP_USE_EFFECT_H
