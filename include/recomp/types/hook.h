#ifndef RECOMP_HOOK_H
#define RECOMP_HOOK_H

#include <recomp/recomp_base.h>

namespace recomp {
    /**
     * Base of everything stored in a scope's hook slots. Slots are addressed by call order, the scope checks the
     * concrete hook type on every access.
     */
    struct RECOMP_EXPORT Hook {
        using u_ptr = std::unique_ptr<Hook>;

        virtual ~Hook() = default;

        /**
         * Called when the owning scope is stopped, hooks are stopped in reverse creation order.
         */
        virtual void stop() {}
    };
} // namespace recomp

#endif  // RECOMP_HOOK_H
