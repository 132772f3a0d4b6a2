#pragma once

// buildid/build_id.hpp: Process-wide build identifier.
//
// get_build_identifier() returns a 128-bit value identifying the build of the
// running binary. Two processes running the same binary get the same value;
// binaries with different code or data get different values with
// overwhelming probability. Equality is unspecified for binaries that differ
// only immaterially (e.g. an embedded build timestamp with identical code).
//
// EXAMPLE:
//   const buildid::BuildIdentifier local = buildid::get_build_identifier();
//   if (local == remote) { /* same binary as the peer */ }
//
// THREAD SAFETY:
//   Any thread may call at any time. The first call computes; concurrent
//   first callers block until that computation finishes. Every caller in the
//   process observes the same value. No error channel: the calculation always
//   succeeds, falling back to weaker sources when stronger ones are missing.
//
// COST:
//   First call: at most one read of the executable file (only when no
//   linker build id is present) plus hashing. Later calls: a load.

#include "buildid/identifier.hpp"
#include "buildid/selector.hpp"

namespace buildid {

BuildIdentifier get_build_identifier();

// Report of the same one-time computation that produced
// get_build_identifier(). Shares its gate and its storage.
const CalculationReport& build_identity_report();

}  // namespace buildid
