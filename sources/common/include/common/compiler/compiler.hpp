#pragma once

#define COMPILER_PRAGMA(x) _Pragma(#x)

#if defined(__clang__)
#   define CLANG_DIAGNOSTIC_PUSH() _Pragma("clang diagnostic push")
#   define CLANG_DIAGNOSTIC_POP() _Pragma("clang diagnostic pop")
#   define CLANG_DIAGNOSTIC_IGNORE(name) COMPILER_PRAGMA(clang diagnostic ignored name)

#   define DIAGNOSTIC_PUSH() CLANG_DIAGNOSTIC_PUSH()
#   define DIAGNOSTIC_POP() CLANG_DIAGNOSTIC_POP()
#   define DIAGNOSTIC_IGNORE(name) CLANG_DIAGNOSTIC_IGNORE(name)
#elif defined(__GNUC__)
// clang-only warning groups such as -Wfunction-effects are unknown to gcc
#   define CLANG_DIAGNOSTIC_PUSH()
#   define CLANG_DIAGNOSTIC_POP()
#   define CLANG_DIAGNOSTIC_IGNORE(name)

#   define DIAGNOSTIC_PUSH() _Pragma("GCC diagnostic push")
#   define DIAGNOSTIC_POP() _Pragma("GCC diagnostic pop")
#   define DIAGNOSTIC_IGNORE(name) COMPILER_PRAGMA(GCC diagnostic ignored name)
#else
#   error "Unsupported compiler"
#endif

#define DIAGNOSTIC_BEGIN_IGNORE(name) \
    DIAGNOSTIC_PUSH() \
    DIAGNOSTIC_IGNORE(name)

#define DIAGNOSTIC_END_IGNORE() \
    DIAGNOSTIC_POP()

// Thread safety analysis annotations, only clang checks them.
#if defined(__clang__)
#   define THREAD_ANNOTATION(x) __attribute__((x))
#else
#   define THREAD_ANNOTATION(x)
#endif

#define CAPABILITY(x) THREAD_ANNOTATION(capability(x))
#define SCOPED_CAPABILITY THREAD_ANNOTATION(scoped_lockable)
#define GUARDED_BY(x) THREAD_ANNOTATION(guarded_by(x))
#define REQUIRES(...) THREAD_ANNOTATION(requires_capability(__VA_ARGS__))
#define ACQUIRE(...) THREAD_ANNOTATION(acquire_capability(__VA_ARGS__))
#define RELEASE(...) THREAD_ANNOTATION(release_capability(__VA_ARGS__))
#define TRY_ACQUIRE(...) THREAD_ANNOTATION(try_acquire_capability(__VA_ARGS__))
#define EXCLUDES(...) THREAD_ANNOTATION(locks_excluded(__VA_ARGS__))
