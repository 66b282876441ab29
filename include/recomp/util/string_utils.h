#ifndef RECOMP_STRING_UTILS_H
#define RECOMP_STRING_UTILS_H

#include <recomp/recomp_base.h>

#include <typeinfo>

namespace recomp {
    /**
     * The demangled, fully qualified name of the type.
     */
    RECOMP_EXPORT std::string type_name(const std::type_info &type);

    /**
     * The demangled type name with namespaces and template arguments removed,
     * i.e. ``app::Counter<int>`` becomes ``Counter``. This is the name a scope is
     * shown with in the tree dump unless the composable declares its own.
     */
    RECOMP_EXPORT std::string short_type_name(const std::type_info &type);
} // namespace recomp

#endif  // RECOMP_STRING_UTILS_H
