#include "platform_detect.hpp"

#if defined(BUILDID_PLATFORM_MACHO)

#include "buildid/platform.hpp"

#include <mach-o/dyld.h>
#include <mach-o/loader.h>

#include <cstdint>
#include <cstring>
#include <system_error>
#include <vector>

namespace buildid {
namespace {

// Walk the load commands of the main image (dyld index 0) for LC_UUID.
std::optional<std::string> main_image_uuid() {
  const struct mach_header* header = _dyld_get_image_header(0);
  if (header == nullptr) return std::nullopt;

  const char* cursor = reinterpret_cast<const char*>(header);
  if (header->magic == MH_MAGIC_64) {
    cursor += sizeof(struct mach_header_64);
  } else if (header->magic == MH_MAGIC) {
    cursor += sizeof(struct mach_header);
  } else {
    return std::nullopt;
  }

  for (uint32_t i = 0; i < header->ncmds; ++i) {
    struct load_command lc;
    std::memcpy(&lc, cursor, sizeof(lc));
    if (lc.cmd == LC_UUID) {
      struct uuid_command uc;
      std::memcpy(&uc, cursor, sizeof(uc));
      return std::string(reinterpret_cast<const char*>(uc.uuid), sizeof(uc.uuid));
    }
    if (lc.cmdsize == 0) break;
    cursor += lc.cmdsize;
  }
  return std::nullopt;
}

class MachOIntrospector final : public PlatformIntrospector {
 public:
  PlatformFamily family() const override { return PlatformFamily::mach_o; }

  std::optional<std::string> embedded_build_id() const override {
    return main_image_uuid();
  }

  std::optional<std::filesystem::path> executable_path() const override {
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);  // reports the required size
    if (size == 0) return std::nullopt;
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) return std::nullopt;

    std::filesystem::path p(buf.data());
    std::error_code ec;
    if (!std::filesystem::exists(p, ec) || ec) return std::nullopt;
    return p;
  }
};

}  // namespace

std::unique_ptr<PlatformIntrospector> make_native_introspector() {
  return std::make_unique<MachOIntrospector>();
}

}  // namespace buildid

#endif  // BUILDID_PLATFORM_MACHO
