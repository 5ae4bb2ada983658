#ifndef OPBRIDGE_EXPORT_H
#define OPBRIDGE_EXPORT_H

// OPBRIDGE_STATIC is defined by the build when opbridge is linked as a static archive.
#if defined(OPBRIDGE_STATIC)
#define OPBRIDGE_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
#if defined(opbridge_EXPORTS)
#define OPBRIDGE_EXPORT __declspec(dllexport)
#else
#define OPBRIDGE_EXPORT __declspec(dllimport)
#endif
#elif defined(__GNUC__) && __GNUC__ >= 4
#define OPBRIDGE_EXPORT __attribute__((visibility("default")))
#else
#define OPBRIDGE_EXPORT
#endif

#endif  // OPBRIDGE_EXPORT_H
