#pragma once

#include "runguard_options.hpp"

namespace kata {

/**
 * Limit current process resources usage.
 *
 * Called in the forked child right before exec, so it only uses
 * async-signal-safe functions and reports failure through the
 * return value instead of throwing.
 *
 * @return 0 on success, otherwise the errno of the failing call.
 */
int set_restrictions(const runguard_options &opt);

}  // namespace kata
