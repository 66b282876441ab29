/*
 * The core imports for recomp. Use this to ensure the correct import order can be maintained.
 */

#ifndef RECOMP_BASE_H
#define RECOMP_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <recomp/recomp_export.h>
#include <recomp/recomp_forward_declarations.h>

#endif  // RECOMP_BASE_H
