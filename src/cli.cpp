#include <iostream>
#include <string>
#include <vector>

#include "buildid/build_id.hpp"
#include "buildid/hash.hpp"
#include "buildid/jsonlite.hpp"
#include "buildid/observability.hpp"
#include "buildid/version.hpp"

namespace {

// Known BLAKE3 test vectors, first 8 output bytes read little-endian.
bool verify_hash_vectors() {
  buildid::HashAccumulator empty;
  if (empty.digest64() != 0xa6a1f9f5b94913afULL) {
    return false;
  }
  buildid::HashAccumulator hello;
  hello.update("hello");
  if (hello.digest64() != 0x928286b33d168feaULL) {
    return false;
  }
  return true;
}

void print_error(const std::string& message) {
  std::cerr << "{\"error\":\"" << buildid::jsonlite::escape(message) << "\"}\n";
}

void print_usage() {
  std::cerr << "usage: buildid [show|hex|report|manifest|health|stats|doctor|compare <id>]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd = argc >= 2 ? argv[1] : "show";

  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    print_usage();
    return 0;
  }

  if (cmd == "show") {
    std::cout << buildid::get_build_identifier().to_string() << "\n";
    return 0;
  }

  if (cmd == "hex") {
    std::cout << buildid::get_build_identifier().to_hex() << "\n";
    return 0;
  }

  if (cmd == "report") {
    std::cout << buildid::build_identity_report().to_json() << "\n";
    return 0;
  }

  if (cmd == "manifest") {
    std::cout << buildid::version::manifest_to_json(buildid::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = buildid::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version
              << "\",\"digest_bits\":" << h.digest_bits
              << ",\"hash_vectors_ok\":" << (verify_hash_vectors() ? "true" : "false")
              << "}\n";
    return 0;
  }

  if (cmd == "stats") {
    // Force the memoized calculation so the counters are meaningful.
    (void)buildid::get_build_identifier();
    std::cout << buildid::global_identity_stats().to_json() << "\n";
    return 0;
  }

  if (cmd == "doctor") {
    std::vector<std::string> blockers;
    if (!verify_hash_vectors())
      blockers.push_back("hash_vectors_failed");

    const auto& report = buildid::build_identity_report();
    if (!report.identifier.has_build_layout())
      blockers.push_back("identifier_layout_invalid");

    // Type identity alone still yields a valid identifier, but it cannot tell
    // two builds of the same program apart.
    std::vector<std::string> warnings;
    if (!report.primary_source)
      warnings.push_back("type_identity_only");

    std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false")
              << ",\"blockers\":[";
    for (size_t i = 0; i < blockers.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << "\"" << blockers[i] << "\"";
    }
    std::cout << "],\"warnings\":[";
    for (size_t i = 0; i < warnings.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << "\"" << warnings[i] << "\"";
    }
    std::cout << "],\"report\":" << report.to_json() << "}\n";
    return blockers.empty() ? 0 : 2;
  }

  if (cmd == "compare") {
    if (argc < 3) {
      print_error("compare requires an identifier argument");
      return 1;
    }
    const auto remote = buildid::BuildIdentifier::parse(argv[2]);
    if (!remote) {
      print_error(std::string("malformed identifier: ") + argv[2]);
      return 1;
    }
    const auto local = buildid::get_build_identifier();
    const bool same = local == *remote;
    std::cout << "{\"same_build\":" << (same ? "true" : "false")
              << ",\"local\":\"" << local.to_string() << "\""
              << ",\"remote\":\"" << remote->to_string() << "\"}\n";
    return same ? 0 : 2;
  }

  print_error("unknown command: " + cmd);
  print_usage();
  return 1;
}
