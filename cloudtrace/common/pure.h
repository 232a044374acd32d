#pragma once

namespace CloudTrace {

/**
 * Friendly name for a pure virtual routine.
 */
#define PURE = 0

} // namespace CloudTrace
