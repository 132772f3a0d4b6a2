#include "buildid/platform.hpp"

#include "platform_detect.hpp"

namespace buildid {
namespace {

class UnsupportedIntrospector final : public PlatformIntrospector {
 public:
  PlatformFamily family() const override { return PlatformFamily::unsupported; }
  std::optional<std::string> embedded_build_id() const override { return std::nullopt; }
  std::optional<std::filesystem::path> executable_path() const override { return std::nullopt; }
};

}  // namespace

std::string to_string(PlatformFamily family) {
  switch (family) {
    case PlatformFamily::elf:         return "elf";
    case PlatformFamily::mach_o:      return "mach_o";
    case PlatformFamily::pe:          return "pe";
    case PlatformFamily::unsupported: return "unsupported";
  }
  return "unsupported";
}

std::unique_ptr<PlatformIntrospector> make_unsupported_introspector() {
  return std::make_unique<UnsupportedIntrospector>();
}

#if defined(BUILDID_PLATFORM_UNSUPPORTED)
std::unique_ptr<PlatformIntrospector> make_native_introspector() {
  return make_unsupported_introspector();
}
#endif

const PlatformIntrospector& native_introspector() {
  static const std::unique_ptr<PlatformIntrospector> instance = make_native_introspector();
  return *instance;
}

}  // namespace buildid
