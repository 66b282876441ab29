#ifndef RECOMP_MEMOIZE_H
#define RECOMP_MEMOIZE_H

#include <recomp/types/element.h>
#include <recomp/types/state_cell.h>

#include <utility>

namespace recomp {
    /**
     * How a dependency is compared between compositions. By default the value itself is kept and compared with
     * ``operator==``. Specialise to compare something cheaper.
     */
    template<typename T>
    struct Memoize {
        using key_type = T;

        static key_type key(const T &value) { return value; }
    };

    /**
     * State is compared by cell identity and generation, the value itself is never compared.
     */
    template<typename T>
    struct Memoize<StateRef<T>> {
        using key_type = std::pair<const void *, uint64_t>;

        static key_type key(const StateRef<T> &value) { return {value.cell(), value.generation()}; }
    };

    /**
     * Elements are compared by node identity.
     */
    template<>
    struct Memoize<Element> {
        using key_type = AnyCompose::s_ptr;

        static key_type key(const Element &value) { return value.node(); }
    };

    template<typename T>
    using memo_key_t = typename Memoize<std::decay_t<T>>::key_type;

    template<typename T>
    memo_key_t<T> memo_key(const T &value) { return Memoize<std::decay_t<T>>::key(value); }
} // namespace recomp

#endif  // RECOMP_MEMOIZE_H
