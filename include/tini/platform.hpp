/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and the invariant assertion macro.
 */

#ifndef TINI_PLATFORM_HPP_
#define TINI_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace tini {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define TINI_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define TINI_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define TINI_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define TINI_PRINTF_FMT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define TINI_PRINTF_FMT(fmt_idx, arg_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "TINI_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

/// Guards internal invariants only. Malformed input never reaches it.
#ifdef NDEBUG
#define TINI_ASSERT(cond) ((void)0)
#else
#define TINI_ASSERT(cond) \
  ((cond) ? ((void)0) : ::tini::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace tini

#endif  // TINI_PLATFORM_HPP_
