#pragma once

namespace CloudTrace {

/**
 * Helper macro from an X-macro list to enumerators.
 */
#define GENERATE_ENUM(X) X,

/**
 * Construct On First Use idiom. The object is built once, on the first call, and is never
 * destroyed. Function-local statics make the construction thread-safe.
 * See https://isocpp.org/wiki/faq/ctors#static-init-order-on-first-use.
 */
#define CONSTRUCT_ON_FIRST_USE(type, ...)                                                          \
  do {                                                                                             \
    static const type* objectptr = new type{__VA_ARGS__};                                          \
    return *objectptr;                                                                             \
  } while (0)

} // namespace CloudTrace
