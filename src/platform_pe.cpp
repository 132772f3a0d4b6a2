#include "platform_detect.hpp"

#if defined(BUILDID_PLATFORM_PE)

#include "buildid/platform.hpp"

#include <windows.h>

#include <cstdint>
#include <cstring>
#include <system_error>

// The CodeView debug record (RSDS) holds a GUID + age that the linker writes
// per link. With /Brepro the GUID is derived from the image content.

namespace buildid {
namespace {

constexpr DWORD kRsdsSignature = 0x53445352;  // 'RSDS'

struct CodeViewRsds {
  DWORD signature;
  GUID  guid;
  DWORD age;
  // char pdb_path[] follows
};

std::optional<std::string> main_module_codeview_id() {
  const auto* base = reinterpret_cast<const unsigned char*>(GetModuleHandleW(nullptr));
  if (base == nullptr) return std::nullopt;

  const auto* dos = reinterpret_cast<const IMAGE_DOS_HEADER*>(base);
  if (dos->e_magic != IMAGE_DOS_SIGNATURE) return std::nullopt;
  const auto* nt = reinterpret_cast<const IMAGE_NT_HEADERS*>(base + dos->e_lfanew);
  if (nt->Signature != IMAGE_NT_SIGNATURE) return std::nullopt;

  const IMAGE_DATA_DIRECTORY& dir =
      nt->OptionalHeader.DataDirectory[IMAGE_DIRECTORY_ENTRY_DEBUG];
  if (dir.VirtualAddress == 0 || dir.Size < sizeof(IMAGE_DEBUG_DIRECTORY)) {
    return std::nullopt;
  }

  const auto* entries =
      reinterpret_cast<const IMAGE_DEBUG_DIRECTORY*>(base + dir.VirtualAddress);
  const std::size_t count = dir.Size / sizeof(IMAGE_DEBUG_DIRECTORY);
  for (std::size_t i = 0; i < count; ++i) {
    const IMAGE_DEBUG_DIRECTORY& entry = entries[i];
    if (entry.Type != IMAGE_DEBUG_TYPE_CODEVIEW || entry.AddressOfRawData == 0 ||
        entry.SizeOfData < sizeof(CodeViewRsds)) {
      continue;
    }
    CodeViewRsds cv;
    std::memcpy(&cv, base + entry.AddressOfRawData, sizeof(cv));
    if (cv.signature != kRsdsSignature) continue;

    std::string id(sizeof(cv.guid) + sizeof(cv.age), '\0');
    std::memcpy(&id[0], &cv.guid, sizeof(cv.guid));
    std::memcpy(&id[sizeof(cv.guid)], &cv.age, sizeof(cv.age));
    return id;
  }
  return std::nullopt;
}

class PeIntrospector final : public PlatformIntrospector {
 public:
  PlatformFamily family() const override { return PlatformFamily::pe; }

  std::optional<std::string> embedded_build_id() const override {
    return main_module_codeview_id();
  }

  std::optional<std::filesystem::path> executable_path() const override {
    std::wstring buf(MAX_PATH, L'\0');
    for (;;) {
      const DWORD len = GetModuleFileNameW(nullptr, &buf[0], static_cast<DWORD>(buf.size()));
      if (len == 0) return std::nullopt;
      if (len < buf.size()) {
        buf.resize(len);
        break;
      }
      if (buf.size() >= 32768) return std::nullopt;  // long-path ceiling
      buf.resize(buf.size() * 2);
    }

    std::filesystem::path p(buf);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec) || ec) return std::nullopt;
    return p;
  }
};

}  // namespace

std::unique_ptr<PlatformIntrospector> make_native_introspector() {
  return std::make_unique<PeIntrospector>();
}

}  // namespace buildid

#endif  // BUILDID_PLATFORM_PE
