#include "buildid/build_id.hpp"

#include "buildid/observability.hpp"

namespace buildid {
namespace {

// One-time gate: the first caller runs the initializer and concurrent callers
// block until it completes.
const CalculationReport& memoized_report() {
  static const CalculationReport report = [] {
    global_identity_stats().memoized_computations.fetch_add(1, std::memory_order_relaxed);
    return calculate_with_report();
  }();
  return report;
}

}  // namespace

BuildIdentifier get_build_identifier() {
  return memoized_report().identifier;
}

const CalculationReport& build_identity_report() {
  return memoized_report();
}

}  // namespace buildid
