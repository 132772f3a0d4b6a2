#include "buildid/selector.hpp"

#include "buildid/jsonlite.hpp"
#include "buildid/observability.hpp"

#include <chrono>
#include <sstream>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>

namespace buildid {
namespace {

constexpr std::string_view kNoteTag  = "buildid:note:";
constexpr std::string_view kImageTag = "buildid:image:";
constexpr std::string_view kTypesTag = "buildid:types:";

// Absorb the runtime type identity of T. Returns the number of identity bytes
// (name + size fields), excluding framing.
template <typename T>
uint64_t mix_type_identity(HashAccumulator& acc) {
  const std::string_view name = typeid(T).name();
  acc.update_u64(name.size());
  acc.update(name);
  acc.update_u64(sizeof(T));
  return name.size() + sizeof(uint64_t);
}

using PrimaryStage = StageOutcome (*)(const PlatformIntrospector&, HashAccumulator&);

struct ChainLink {
  IdentitySource source;
  bool SelectorOptions::*enabled;
  PrimaryStage run;
};

// Ordered by strength of the uniqueness guarantee.
const ChainLink kPrimaryChain[] = {
    {IdentitySource::platform_build_id, &SelectorOptions::use_platform_build_id,
     &hash_platform_build_id},
    {IdentitySource::executable_image, &SelectorOptions::use_executable_image,
     &hash_executable_image},
};

StageOutcome disabled_outcome(IdentitySource source) {
  StageOutcome out;
  out.source = source;
  out.error = source == IdentitySource::platform_build_id
                  ? SourceError::metadata_unavailable
                  : SourceError::executable_unreadable;
  out.detail = "disabled";
  return out;
}

}  // namespace

std::string to_string(IdentitySource source) {
  switch (source) {
    case IdentitySource::platform_build_id: return "platform_build_id";
    case IdentitySource::executable_image:  return "executable_image";
    case IdentitySource::type_fingerprint:  return "type_fingerprint";
  }
  return "type_fingerprint";
}

std::string to_string(SourceError error) {
  switch (error) {
    case SourceError::none:                  return "none";
    case SourceError::metadata_unavailable:  return "metadata_unavailable";
    case SourceError::executable_unreadable: return "executable_unreadable";
  }
  return "none";
}

StageOutcome hash_platform_build_id(const PlatformIntrospector& introspector,
                                    HashAccumulator& acc) {
  StageOutcome out;
  out.source = IdentitySource::platform_build_id;

  const std::optional<std::string> id = introspector.embedded_build_id();
  if (!id || id->empty()) {
    out.error = SourceError::metadata_unavailable;
    out.detail = "no embedded build id (" + to_string(introspector.family()) + ")";
    return out;
  }

  acc.update(kNoteTag);
  acc.update_u64(id->size());
  acc.update(*id);

  out.ok = true;
  out.bytes_hashed = id->size();
  out.detail = to_hex(reinterpret_cast<const uint8_t*>(id->data()), id->size());
  return out;
}

StageOutcome hash_executable_image(const PlatformIntrospector& introspector,
                                   HashAccumulator& acc) {
  StageOutcome out;
  out.source = IdentitySource::executable_image;

  const std::optional<std::filesystem::path> path = introspector.executable_path();
  if (!path) {
    out.error = SourceError::executable_unreadable;
    out.detail = "executable path unavailable (" + to_string(introspector.family()) + ")";
    return out;
  }

  acc.update(kImageTag);
  const std::optional<uint64_t> bytes = hash_file_into(*path, acc);
  if (!bytes) {
    out.error = SourceError::executable_unreadable;
    out.detail = "cannot read " + path->u8string();
    return out;
  }

  out.ok = true;
  out.bytes_hashed = *bytes;
  out.detail = path->u8string();
  return out;
}

StageOutcome hash_type_fingerprint(HashAccumulator& acc) {
  // Two distinct closure types. Their identity is derived from this
  // function's signature and their position in it.
  auto unit_closure = [](std::monostate v) { return v; };
  auto byte_closure = [](uint8_t v) { return v; };
  (void)unit_closure;
  (void)byte_closure;

  StageOutcome out;
  out.source = IdentitySource::type_fingerprint;

  acc.update(kTypesTag);
  uint64_t bytes = 0;
  bytes += mix_type_identity<std::monostate>(acc);
  bytes += mix_type_identity<uint8_t>(acc);
  bytes += mix_type_identity<decltype(unit_closure)>(acc);
  bytes += mix_type_identity<decltype(byte_closure)>(acc);

  out.ok = true;
  out.bytes_hashed = bytes;
  out.detail = "4 types";
  return out;
}

CalculationReport calculate_with_report(const SelectorOptions& options) {
  const auto start = std::chrono::steady_clock::now();
  const PlatformIntrospector& introspector =
      options.introspector ? *options.introspector : native_introspector();

  CalculationReport report;
  report.platform = introspector.family();

  HashAccumulator acc;
  for (const ChainLink& link : kPrimaryChain) {
    if (!(options.*link.enabled)) {
      report.stages.push_back(disabled_outcome(link.source));
      continue;
    }
    HashAccumulator trial = acc;
    StageOutcome outcome = link.run(introspector, trial);
    const bool ok = outcome.ok;
    report.stages.push_back(std::move(outcome));
    if (ok) {
      acc = trial;
      report.primary_source = link.source;
      break;
    }
  }

  report.stages.push_back(hash_type_fingerprint(acc));
  report.identifier = format_identifier(acc);

  report.duration_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now() - start)
          .count());

  global_identity_stats().record(report);
  return report;
}

BuildIdentifier calculate_build_identifier(const SelectorOptions& options) {
  return calculate_with_report(options).identifier;
}

std::string CalculationReport::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"identifier\":\"" << identifier.to_string() << "\""
    << ",\"platform\":\"" << buildid::to_string(platform) << "\""
    << ",\"primary_source\":\""
    << (primary_source ? buildid::to_string(*primary_source) : std::string("none")) << "\""
    << ",\"stages\":[";
  for (std::size_t i = 0; i < stages.size(); ++i) {
    const StageOutcome& s = stages[i];
    if (i > 0) o << ",";
    o << "{"
      << "\"source\":\"" << buildid::to_string(s.source) << "\""
      << ",\"ok\":" << (s.ok ? "true" : "false")
      << ",\"error\":\"" << buildid::to_string(s.error) << "\""
      << ",\"detail\":\"" << jsonlite::escape(s.detail) << "\""
      << ",\"bytes_hashed\":" << s.bytes_hashed
      << "}";
  }
  o << "]"
    << ",\"duration_ns\":" << duration_ns
    << "}";
  return o.str();
}

}  // namespace buildid
