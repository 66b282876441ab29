#ifndef RECOMP_USE_CONTEXT_H
#define RECOMP_USE_CONTEXT_H

#include <recomp/types/error_type.h>
#include <recomp/types/hook.h>
#include <recomp/types/scope.h>
#include <recomp/util/errors.h>
#include <recomp/util/string_utils.h>

#include <type_traits>

namespace recomp {
    /**
     * The nearest value of type ``T`` provided by an ancestor of the scope (or on the Composer), nullptr if there
     * is none.
     */
    template<typename T>
    std::shared_ptr<const T> find_context(const Scope &scope) {
        return std::static_pointer_cast<const T>(scope.find_context(std::type_index{typeid(T)}));
    }

    /**
     * As ``find_context`` but raises ContextError when no ancestor provides ``T``.
     */
    template<typename T>
    std::shared_ptr<const T> use_context(const Scope &scope) {
        auto value{find_context<T>(scope)};
        if (value == nullptr) { throw_error<ContextError>("Context value not found for type: {}", type_name(typeid(T))); }
        return value;
    }

    template<typename T>
    struct ProviderHook final : Hook {
        explicit ProviderHook(std::shared_ptr<T> value_) : value{std::move(value_)} {}

        std::shared_ptr<T> value;
    };

    /**
     * Provide a value of type ``T`` to the descendants of the scope. ``make_value`` is called on the first
     * composition only, the same value is provided for the life of the scope.
     *
     * The scope itself keeps write access through the returned pointer, descendants only ever see it as const.
     */
    template<typename Make>
    auto use_provider(Scope &scope, Make &&make_value) {
        using T = std::decay_t<std::invoke_result_t<Make &>>;
        auto &hook{scope.use_hook<ProviderHook<T>>([&] {
            auto value{std::make_shared<T>(make_value())};
            scope.provide_context(std::type_index{typeid(T)}, value);
            return std::make_unique<ProviderHook<T>>(std::move(value));
        })};
        return hook.value;
    }
} // namespace recomp

#endif  // RECOMP_USE_CONTEXT_H
