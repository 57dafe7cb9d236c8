#pragma once

#include <cstdio>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#define LATTICE_LIKELY(x) (__builtin_expect(!!(x), 1))
#define LATTICE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define LATTICE_LIKELY(x) (x)
#define LATTICE_UNLIKELY(x) (x)
#endif

#ifndef LATTICE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(LATTICE_SHARED_BUILD)
#define LATTICE_API __declspec(dllexport)
#elif defined(LATTICE_SHARED)
#define LATTICE_API __declspec(dllimport)
#else
#define LATTICE_API
#endif
#define LATTICE_LOCAL
#else
#if defined(LATTICE_SHARED_BUILD) || defined(LATTICE_SHARED)
#define LATTICE_API __attribute__((visibility("default")))
#else
#define LATTICE_API
#endif
#define LATTICE_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef LATTICE_LOCAL
#define LATTICE_LOCAL
#endif

/// @brief Reports a broken contract and terminates. Used by checked accessors only.
#define LATTICE_ABORT(message)                                                     \
    do                                                                             \
    {                                                                              \
        std::fprintf(stderr, "[Lattice] fatal: %s (%s:%d)\n", message, __FILE__, __LINE__); \
        std::abort();                                                              \
    } while (false)

namespace Lattice
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace Lattice
