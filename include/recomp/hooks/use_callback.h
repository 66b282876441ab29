#ifndef RECOMP_USE_CALLBACK_H
#define RECOMP_USE_CALLBACK_H

#include <recomp/types/hook.h>
#include <recomp/types/scope.h>

#include <functional>
#include <memory>

namespace recomp {
    template<typename Signature>
    struct CallbackHook final : Hook {
        std::shared_ptr<std::function<Signature>> target{std::make_shared<std::function<Signature>>()};
        std::shared_ptr<std::function<Signature>> callback;

        CallbackHook() {
            callback = std::make_shared<std::function<Signature>>(
                [weak_target = std::weak_ptr{target}](auto &&...args) {
                    auto fn{weak_target.lock()};
                    if (fn == nullptr || !*fn) { throw std::bad_function_call(); }
                    return (*fn)(std::forward<decltype(args)>(args)...);
                });
        }
    };

    /**
     * A callable with a stable identity for the life of the scope, that always forwards to the ``fn`` given on the
     * latest composition. Calling it once the scope has been destroyed raises ``std::bad_function_call``.
     *
     *     auto on_click = use_callback<void(int)>(scope, [set](int v) { set(v); });
     */
    template<typename Signature, typename Fn>
    std::shared_ptr<const std::function<Signature>> use_callback(Scope &scope, Fn &&fn) {
        auto &hook{scope.use_hook<CallbackHook<Signature>>([] { return std::make_unique<CallbackHook<Signature>>(); })};
        *hook.target = std::forward<Fn>(fn);
        return hook.callback;
    }
} // namespace recomp

#endif  // RECOMP_USE_CALLBACK_H
