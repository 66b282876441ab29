#ifndef RECOMP_USE_TASK_H
#define RECOMP_USE_TASK_H

#include <recomp/runtime/composer.h>
#include <recomp/runtime/executor.h>
#include <recomp/types/hook.h>

#include <type_traits>

namespace recomp {
    struct TaskHook final : Hook {
        bool spawned{false};
    };

    namespace detail {
        template<typename Make>
        void use_task_impl(Scope &scope, Make &make_work, bool local) {
            auto &hook{scope.use_hook<TaskHook>([] { return std::make_unique<TaskHook>(); })};
            if (hook.spawned) { return; }
            Task::work_type work{make_work()};
            // Spawned once the pass completes so a composition that is rolled back never leaves work behind
            scope.composer().queue_effect(scope, [&scope, &hook, work = std::move(work), local] {
                hook.spawned = true;
                Task task{scope.lifetime(), work, scope.path()};
                auto &executor{*scope.composer().executor()};
                if (local) {
                    executor.spawn_local(std::move(task));
                } else {
                    executor.spawn(std::move(task));
                }
            });
        }
    } // namespace detail

    /**
     * Start background work bound to the scope. ``make_work()`` is called on the first composition and returns the
     * work, a callable taking ``const Task &``. The work may run on any thread the executor chooses, it is cancelled
     * when the scope is destroyed and should return early once ``task.cancelled()`` is true. State written from the
     * work through a Setter after the scope has gone is dropped.
     */
    template<typename Make>
    void use_task(Scope &scope, Make &&make_work) {
        detail::use_task_impl(scope, make_work, false);
    }

    /**
     * As ``use_task`` but the work stays on the composing thread, it is run when the executor is polled at the end
     * of a pass.
     */
    template<typename Make>
    void use_local_task(Scope &scope, Make &&make_work) {
        detail::use_task_impl(scope, make_work, true);
    }
} // namespace recomp

#endif  // RECOMP_USE_TASK_H
