#ifndef RECOMP_FORWARD_DECLARATIONS_H
#define RECOMP_FORWARD_DECLARATIONS_H

namespace recomp {
    // Scope - owned by its parent (or the Composer for the root) via unique_ptr
    struct Scope;
    using scope_ptr = Scope *;

    // Composer - owned by the host, never shared
    struct Composer;

    // Element / AnyCompose - immutable, shared between handles
    struct AnyCompose;
    struct Element;
    struct Children;

    // Hook - owned by the Scope that created it
    struct Hook;

    template<typename T>
    struct StateCell;
    template<typename T>
    struct StateRef;
    template<typename T>
    struct Setter;

    struct DirtyScheduler;
    struct DirtyEntry;

    // UpdateQueue - shared between the Composer and every Setter (weakly)
    struct UpdateQueue;

    // Executor - supplied by the host, shared
    struct Executor;
    struct Task;
    struct LifetimeToken;

    struct CompositionLifeCycleObserver;

    struct CompositionError;
    struct CompositionException;
    struct ContextError;
    struct HookOrderError;
} // namespace recomp

#endif  // RECOMP_FORWARD_DECLARATIONS_H
