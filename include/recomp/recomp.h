#ifndef RECOMP_H
#define RECOMP_H

#include <recomp/hooks/use_callback.h>
#include <recomp/hooks/use_context.h>
#include <recomp/hooks/use_drop.h>
#include <recomp/hooks/use_effect.h>
#include <recomp/hooks/use_memo.h>
#include <recomp/hooks/use_ref.h>
#include <recomp/hooks/use_state.h>
#include <recomp/hooks/use_task.h>
#include <recomp/nodes/error_boundary.h>
#include <recomp/nodes/fallible.h>
#include <recomp/nodes/for_each.h>
#include <recomp/nodes/from_fn.h>
#include <recomp/nodes/memo.h>
#include <recomp/runtime/composer.h>
#include <recomp/runtime/observers/composition_profiler.h>
#include <recomp/runtime/observers/composition_trace.h>

#endif  // RECOMP_H
