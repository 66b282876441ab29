#ifndef RECOMP_MEMO_H
#define RECOMP_MEMO_H

#include <recomp/hooks/use_ref.h>
#include <recomp/types/element.h>
#include <recomp/types/memoize.h>

#include <optional>

namespace recomp {
    /**
     * Composes ``content`` only when ``dependency`` differs from the one it was last composed with. While the
     * dependency is unchanged the existing subtree is left exactly as it is, its scopes are not recomposed (scopes
     * inside it that dirtied themselves are still recomposed on their own).
     *
     * Dependencies compare with ``operator==`` unless Memoize<D> says otherwise, i.e. a StateRef compares by the
     * generation of its cell.
     */
    template<typename D>
    struct Memo {
        static constexpr std::string_view name{"Memo"};

        D dependency;
        Element content;

        Children compose(Scope &scope) const {
            auto &last{use_ref(scope, [] { return std::optional<memo_key_t<D>>{}; })};
            auto key{memo_key(dependency)};
            if (last && *last == key) { return Children::keep(); }
            last = std::move(key);
            return {content};
        }
    };

    template<typename D>
    Memo<std::decay_t<D>> memo(D &&dependency, Element content) {
        return Memo<std::decay_t<D>>{std::forward<D>(dependency), std::move(content)};
    }
} // namespace recomp

#endif  // RECOMP_MEMO_H
