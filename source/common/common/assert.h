#pragma once

#include <cstdlib>
#include <string>

#include "source/common/common/logger.h"

// Logs the failed condition on the assert logger and aborts. The condition is stringified before
// macro expansion so the log shows it as written.
#define CLOUDTRACE_ASSERT_OR_ABORT(CONDITION, CONDITION_STR, DETAILS)                              \
  do {                                                                                             \
    if (!(CONDITION)) {                                                                            \
      const std::string details = (DETAILS);                                                       \
      CLOUDTRACE_LOG_TO_LOGGER(::CloudTrace::Logger::Registry::getLog(                             \
                                   ::CloudTrace::Logger::Id::assert),                              \
                               critical, "assert failure: {}.{}{}", CONDITION_STR,                 \
                               details.empty() ? "" : " Details: ", details);                      \
      ::abort();                                                                                   \
    }                                                                                              \
  } while (false)

/**
 * Checked in every build.
 *
 * RELEASE_ASSERT(regex.ok(), "Invalid regex");
 */
#define RELEASE_ASSERT(X, DETAILS) CLOUDTRACE_ASSERT_OR_ABORT(X, #X, DETAILS)

/**
 * Checked in debug builds only. In release builds X must still compile but is never evaluated.
 */
#if !defined(NDEBUG)
#define ASSERT(X) CLOUDTRACE_ASSERT_OR_ABORT(X, #X, "")
#else
#define ASSERT(X)                                                                                  \
  do {                                                                                             \
    constexpr bool __assert_unused = false && static_cast<bool>(X);                                \
    (void)__assert_unused;                                                                         \
  } while (false)
#endif

#define PANIC(X)                                                                                   \
  do {                                                                                             \
    CLOUDTRACE_LOG_TO_LOGGER(                                                                      \
        ::CloudTrace::Logger::Registry::getLog(::CloudTrace::Logger::Id::assert), critical,        \
        "panic: {}", X);                                                                           \
    ::abort();                                                                                     \
  } while (false)

#define PANIC_DUE_TO_CORRUPT_ENUM PANIC("corrupted enum")
