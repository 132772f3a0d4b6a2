#include "buildid/observability.hpp"

#include "buildid/selector.hpp"

#include <sstream>

namespace buildid {

void IdentityStats::record(const CalculationReport& report) {
  calculations.fetch_add(1, std::memory_order_relaxed);

  if (!report.primary_source) {
    type_fingerprint_only.fetch_add(1, std::memory_order_relaxed);
  } else if (*report.primary_source == IdentitySource::platform_build_id) {
    platform_build_id_selected.fetch_add(1, std::memory_order_relaxed);
  } else if (*report.primary_source == IdentitySource::executable_image) {
    executable_image_selected.fetch_add(1, std::memory_order_relaxed);
  }

  for (const StageOutcome& s : report.stages) {
    if (s.ok && s.source == IdentitySource::executable_image) {
      executable_bytes_hashed.fetch_add(s.bytes_hashed, std::memory_order_relaxed);
    }
  }
}

std::string IdentityStats::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"calculations\":" << calculations.load(std::memory_order_relaxed)
    << ",\"memoized_computations\":" << memoized_computations.load(std::memory_order_relaxed)
    << ",\"platform_build_id_selected\":" << platform_build_id_selected.load(std::memory_order_relaxed)
    << ",\"executable_image_selected\":" << executable_image_selected.load(std::memory_order_relaxed)
    << ",\"type_fingerprint_only\":" << type_fingerprint_only.load(std::memory_order_relaxed)
    << ",\"executable_bytes_hashed\":" << executable_bytes_hashed.load(std::memory_order_relaxed)
    << "}";
  return o.str();
}

IdentityStats& global_identity_stats() {
  static IdentityStats stats;
  return stats;
}

}  // namespace buildid
