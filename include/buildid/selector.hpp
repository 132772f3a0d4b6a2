#pragma once

// buildid/selector.hpp: Identity source selection (fallback chain).
//
// CHAIN (first primary success wins, final stage always runs):
//   1. platform_build_id   linker-embedded id of the running executable
//   2. executable_image    full byte stream of the executable file
//                          (only attempted when stage 1 failed)
//   3. type_fingerprint    typeid names/sizes of fixed reference types
//                          (infallible, always appended)
//
// DOMAIN SEPARATION:
//   Every source is prefixed with its own tag ("buildid:note:",
//   "buildid:image:", "buildid:types:") and length-delimited where the length
//   is known up front. The tags are part of SOURCE_TAG_VERSION.
//
// FAILURE ISOLATION:
//   Primary stages run against a scratch copy of the accumulator. A stage that
//   fails halfway (e.g. a read error after some bytes were absorbed) leaves no
//   trace in the final identifier.
//
// DETERMINISM:
//   The identifier is a pure function of the binary and its platform metadata.
//   Options select which stages may run; they never feed the hash.
//   CalculationReport::duration_ns is diagnostic only.
//
// EXTENSION_POINT: additional_sources
//   New primary sources slot into the chain table in selector.cpp ahead of or
//   between the existing stages. Adding one changes identifiers on platforms
//   where it succeeds: bump SOURCE_TAG_VERSION.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "buildid/hash.hpp"
#include "buildid/identifier.hpp"
#include "buildid/platform.hpp"

namespace buildid {

enum class IdentitySource {
  platform_build_id,
  executable_image,
  type_fingerprint,
};

std::string to_string(IdentitySource source);

enum class SourceError {
  none,
  metadata_unavailable,   // stage 1: no embedded build id
  executable_unreadable,  // stage 2: no path, open denied, read error
};

std::string to_string(SourceError error);

struct StageOutcome {
  IdentitySource source{IdentitySource::type_fingerprint};
  bool ok{false};
  SourceError error{SourceError::none};
  std::string detail;
  uint64_t bytes_hashed{0};
};

struct SelectorOptions {
  // nullptr selects native_introspector(). Not owned.
  const PlatformIntrospector* introspector{nullptr};
  bool use_platform_build_id{true};
  bool use_executable_image{true};
};

struct CalculationReport {
  BuildIdentifier identifier;
  PlatformFamily platform{PlatformFamily::unsupported};
  std::optional<IdentitySource> primary_source;  // nullopt: type identity only
  std::vector<StageOutcome> stages;              // in execution order
  uint64_t duration_ns{0};

  std::string to_json() const;
};

// Individual stages. Primary stages may leave `acc` partially updated on
// failure; the chain runs them against a scratch copy.
StageOutcome hash_platform_build_id(const PlatformIntrospector& introspector,
                                    HashAccumulator& acc);
StageOutcome hash_executable_image(const PlatformIntrospector& introspector,
                                   HashAccumulator& acc);
StageOutcome hash_type_fingerprint(HashAccumulator& acc);

// Run the full chain and format the result. Never fails.
CalculationReport calculate_with_report(const SelectorOptions& options = SelectorOptions{});

// Direct (uncached) calculation.
BuildIdentifier calculate_build_identifier(const SelectorOptions& options = SelectorOptions{});

}  // namespace buildid
