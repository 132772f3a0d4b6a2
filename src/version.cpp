#include "buildid/version.hpp"

#include "buildid/build_id.hpp"
#include "buildid/hash.hpp"

#include <sstream>

#ifndef BUILDID_SEMVER
#define BUILDID_SEMVER "0.0.0"
#endif

namespace buildid {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver  = BUILDID_SEMVER;
  m.hash_primitive = hash_runtime_info().primitive;

  const CalculationReport& report = build_identity_report();
  m.platform         = to_string(report.platform);
  m.primary_source   = report.primary_source ? to_string(*report.primary_source) : "none";
  m.build_identifier = report.identifier.to_string();
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_abi\":" << m.engine_abi
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"identifier_layout\":" << m.identifier_layout
    << ",\"source_tags\":" << m.source_tags
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"platform\":\"" << m.platform << "\""
    << ",\"primary_source\":\"" << m.primary_source << "\""
    << ",\"build_identifier\":\"" << m.build_identifier << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(uint32_t caller_abi_version) {
  CompatibilityResult r;
  if (caller_abi_version != ENGINE_ABI_VERSION) {
    r.ok          = false;
    r.error_code  = "abi_version_mismatch";
    r.description = "Caller ABI version " + std::to_string(caller_abi_version) +
                    " != library ABI version " + std::to_string(ENGINE_ABI_VERSION) +
                    ". Rebuild the caller against the current buildid headers.";
    r.required_abi = ENGINE_ABI_VERSION;
    r.actual_abi   = caller_abi_version;
  }
  return r;
}

}  // namespace version
}  // namespace buildid
