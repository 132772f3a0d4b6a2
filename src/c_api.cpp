#include "buildid/c_api.h"

// Stable C ABI implementation.
//
// Invariants:
//   - No C++ types cross the ABI boundary.
//   - Output strings are malloc'd copies, freed via buildid_free_string().
//   - Allocation failures are caught here; callers never see C++ exceptions.

#include <cstdlib>
#include <cstring>
#include <new>
#include <string>

#include "buildid/build_id.hpp"
#include "buildid/version.hpp"

static_assert(BUILDID_BYTES == buildid::kIdentifierBytes, "C ABI identifier size drift");
static_assert(BUILDID_STRING_BUFFER_SIZE == buildid::kIdentifierStringLength + 1,
              "C ABI string buffer size drift");
static_assert(BUILDID_ABI_VERSION == buildid::version::ENGINE_ABI_VERSION,
              "C ABI version drift");

namespace {

char* dup_string(const std::string& s) {
  char* out = static_cast<char*>(std::malloc(s.size() + 1));
  if (out == nullptr) return nullptr;
  std::memcpy(out, s.c_str(), s.size() + 1);
  return out;
}

}  // namespace

extern "C" {

uint32_t buildid_abi_version(void) {
  return BUILDID_ABI_VERSION;
}

int buildid_get_bytes(uint8_t out[BUILDID_BYTES]) {
  if (out == nullptr) return -1;
  try {
    const auto id = buildid::get_build_identifier();
    std::memcpy(out, id.bytes().data(), id.bytes().size());
    return 0;
  } catch (const std::bad_alloc&) {
    return -1;
  }
}

int buildid_get_string(char* out, size_t out_len) {
  if (out == nullptr || out_len < BUILDID_STRING_BUFFER_SIZE) return -1;
  try {
    const std::string s = buildid::get_build_identifier().to_string();
    std::memcpy(out, s.c_str(), s.size() + 1);
    return 0;
  } catch (const std::bad_alloc&) {
    return -1;
  }
}

char* buildid_report_json(void) {
  try {
    return dup_string(buildid::build_identity_report().to_json());
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}

char* buildid_manifest_json(void) {
  try {
    return dup_string(buildid::version::manifest_to_json(buildid::version::current_manifest()));
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}

void buildid_free_string(char* s) {
  std::free(s);
}

}  // extern "C"
