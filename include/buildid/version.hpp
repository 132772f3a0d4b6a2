#pragma once

// buildid/version.hpp: Version manifest for every format this library emits.
//
// PURPOSE:
//   Identifiers are only comparable between peers that derive them the same
//   way. Each constant below pins one part of the derivation. Changing any of
//   them changes identifiers for otherwise identical binaries, so peers must
//   compare manifests before trusting an identifier mismatch.
//
// INVARIANT:
//   All version constants are compile-time. check_compatibility() never
//   throws; it returns a structured result.
//
// EXTENSION_POINT: peer_manifest_negotiation
//   Current: consumers embed manifest_to_json() (or just the identifier) in
//   their own handshake and compare out of band.
//   Upgrade path: a parse_manifest_json() counterpart so a peer manifest can
//   be checked field by field before the identifiers are compared.

#include <cstdint>
#include <string>

namespace buildid {
namespace version {

// ---------------------------------------------------------------------------
// ENGINE_ABI_VERSION
// Increment when the C API (c_api.h) binary interface changes.
// ---------------------------------------------------------------------------
constexpr uint32_t ENGINE_ABI_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, digest truncated to the first 8 output bytes read
// little-endian.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// IDENTIFIER_LAYOUT_VERSION
// Version 1 = two little-endian 64-bit digests separated by discriminator
// byte 0x01, RFC 4122 version 4 / variant 10 bits.
// ---------------------------------------------------------------------------
constexpr uint32_t IDENTIFIER_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// SOURCE_TAG_VERSION
// Version 1 = "buildid:note:", "buildid:image:", "buildid:types:" domain tags,
// chain order note > image, type fingerprint over monostate, uint8_t and two
// closure types.
// ---------------------------------------------------------------------------
constexpr uint32_t SOURCE_TAG_VERSION = 1;

struct VersionManifest {
  uint32_t engine_abi{ENGINE_ABI_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t identifier_layout{IDENTIFIER_LAYOUT_VERSION};
  uint32_t source_tags{SOURCE_TAG_VERSION};
  std::string engine_semver;     // from the CMake project version
  std::string hash_primitive;    // "blake3"
  std::string platform;          // elf | mach_o | pe | unsupported
  std::string primary_source;    // stage that supplied the memoized identifier
  std::string build_identifier;  // canonical string form
};

// Manifest for this process. Triggers the memoized identifier calculation.
VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // empty if ok
  std::string description;
  uint32_t required_abi{ENGINE_ABI_VERSION};
  uint32_t actual_abi{ENGINE_ABI_VERSION};
};

CompatibilityResult check_compatibility(uint32_t caller_abi_version = ENGINE_ABI_VERSION);

}  // namespace version
}  // namespace buildid
