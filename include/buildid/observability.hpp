#pragma once

// buildid/observability.hpp: Process-wide counters for identity calculation.
//
// The identity core never logs and never surfaces errors. What it did is
// observable through two channels instead:
//   - CalculationReport (selector.hpp): per-calculation stage outcomes.
//   - IdentityStats (here): aggregate counters across all calculations in the
//     process, including direct (uncached) ones.
//
// Exposed via:
//   buildid stats      (CLI)
//   buildid_report_json() (C ABI, per-calculation report)
//
// All counters are relaxed atomics. Values are monotonic for the lifetime of
// the process and reset on restart.

#include <atomic>
#include <cstdint>
#include <string>

namespace buildid {

struct CalculationReport;

struct IdentityStats {
  std::atomic<uint64_t> calculations{0};
  // Runs of the memoized accessor's one-time computation. Never exceeds 1.
  std::atomic<uint64_t> memoized_computations{0};

  std::atomic<uint64_t> platform_build_id_selected{0};
  std::atomic<uint64_t> executable_image_selected{0};
  std::atomic<uint64_t> type_fingerprint_only{0};

  std::atomic<uint64_t> executable_bytes_hashed{0};

  void record(const CalculationReport& report);
  std::string to_json() const;
};

IdentityStats& global_identity_stats();

}  // namespace buildid
