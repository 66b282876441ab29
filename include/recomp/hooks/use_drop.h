#ifndef RECOMP_USE_DROP_H
#define RECOMP_USE_DROP_H

#include <recomp/types/hook.h>
#include <recomp/types/scope.h>

#include <functional>

namespace recomp {
    struct DropHook final : Hook {
        std::function<void()> on_drop;

        void stop() override {
            if (!on_drop) { return; }
            auto fn{std::move(on_drop)};
            on_drop = nullptr;
            fn();
        }
    };

    /**
     * Run ``fn`` when the scope is destroyed. The function given on the latest composition is the one that runs.
     */
    template<typename Fn>
    void use_drop(Scope &scope, Fn &&fn) {
        auto &hook{scope.use_hook<DropHook>([] { return std::make_unique<DropHook>(); })};
        hook.on_drop = std::forward<Fn>(fn);
    }
} // namespace recomp

#endif  // RECOMP_USE_DROP_H
