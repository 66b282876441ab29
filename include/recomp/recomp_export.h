#ifndef RECOMP_EXPORT_H
#define RECOMP_EXPORT_H

// recomp_EXPORTS is defined by CMake while the shared library itself is being built.
#if defined _WIN32 || defined __CYGWIN__
#  if defined recomp_EXPORTS
#    define RECOMP_EXPORT __declspec(dllexport)
#  else
#    define RECOMP_EXPORT __declspec(dllimport)
#  endif
#  pragma warning(disable : 4251 4275)
#elif defined __GNUC__
#  define RECOMP_EXPORT __attribute__((visibility("default")))
#else
#  define RECOMP_EXPORT
#endif

#endif  // RECOMP_EXPORT_H
