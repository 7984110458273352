#pragma once

#include <string>
#include <vector>

#include "metric_record.h"

namespace Benchkit {

/**
 * Copy of ctx without the x key and the per-sample keys (fname, timestamp).
 */
Context ReduceContext(const Context& ctx, const std::string& x_key);

/**
 * Canonical text form of a context: keys in sorted order, values tagged by
 * type so that 1, 1.0 and "1" never collide. Example:
 *   {"bs":s"4k","depth":i1,"ratio":d0.5}
 */
std::string CanonicalForm(const Context& ctx);

/**
 * Stable identifier of a context: lowercase hex MD5 of CanonicalForm(ctx).
 * Used for grouping only.
 */
std::string Fingerprint(const Context& ctx);

} // namespace Benchkit
