#include "platform_detect.hpp"

#if defined(BUILDID_PLATFORM_ELF)

#include "buildid/platform.hpp"

#include <elf.h>
#include <link.h>

#if defined(__FreeBSD__) || defined(__DragonFly__)
#  include <sys/types.h>
#  include <sys/sysctl.h>
#endif

#include <cstring>
#include <system_error>

// ELF notes are padded to 4 bytes (8 for some PT_NOTE segments with p_align 8).
// The build-id note is owned by "GNU" and typed NT_GNU_BUILD_ID; its
// descriptor is the linker-computed digest (usually SHA-1, 20 bytes).

#ifndef NT_GNU_BUILD_ID
#  define NT_GNU_BUILD_ID 3
#endif

namespace buildid {
namespace {

constexpr char kGnuNoteOwner[] = "GNU";

inline std::size_t align_up(std::size_t value, std::size_t align) {
  return (value + align - 1) & ~(align - 1);
}

// Scan one PT_NOTE segment for the GNU build-id note.
bool find_build_id_note(const char* begin, std::size_t size, std::size_t align,
                        std::string& out) {
  std::size_t offset = 0;
  while (offset + sizeof(ElfW(Nhdr)) <= size) {
    ElfW(Nhdr) header;
    std::memcpy(&header, begin + offset, sizeof(header));
    const std::size_t name_offset = offset + sizeof(header);
    const std::size_t desc_offset = name_offset + align_up(header.n_namesz, align);
    const std::size_t next = desc_offset + align_up(header.n_descsz, align);
    if (desc_offset > size || desc_offset + header.n_descsz > size) return false;

    if (header.n_type == NT_GNU_BUILD_ID &&
        header.n_namesz == sizeof(kGnuNoteOwner) &&
        std::memcmp(begin + name_offset, kGnuNoteOwner, sizeof(kGnuNoteOwner)) == 0 &&
        header.n_descsz > 0) {
      out.assign(begin + desc_offset, header.n_descsz);
      return true;
    }
    if (next <= offset) return false;
    offset = next;
  }
  return false;
}

// dl_iterate_phdr visits the main program first. Only that object is
// inspected; shared libraries carry their own ids and do not identify the
// executable.
int main_program_build_id(struct dl_phdr_info* info, std::size_t /*size*/, void* data) {
  auto* out = static_cast<std::optional<std::string>*>(data);
  for (ElfW(Half) i = 0; i < info->dlpi_phnum; ++i) {
    const ElfW(Phdr)& phdr = info->dlpi_phdr[i];
    if (phdr.p_type != PT_NOTE) continue;
    const char* notes = reinterpret_cast<const char*>(info->dlpi_addr + phdr.p_vaddr);
    const std::size_t align = phdr.p_align == 8 ? 8 : 4;
    std::string id;
    if (find_build_id_note(notes, phdr.p_memsz, align, id)) {
      *out = std::move(id);
      break;
    }
  }
  return 1;  // stop after the main program
}

class ElfIntrospector final : public PlatformIntrospector {
 public:
  PlatformFamily family() const override { return PlatformFamily::elf; }

  std::optional<std::string> embedded_build_id() const override {
    std::optional<std::string> id;
    dl_iterate_phdr(main_program_build_id, &id);
    return id;
  }

  std::optional<std::filesystem::path> executable_path() const override {
#if defined(__linux__)
    // The kernel resolves this link to the mapped image even if the file was
    // replaced on disk after exec.
    return existing("/proc/self/exe");
#elif defined(__FreeBSD__) || defined(__DragonFly__)
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
    char buf[4096];
    std::size_t len = sizeof(buf);
    if (sysctl(mib, 4, buf, &len, nullptr, 0) != 0 || len == 0) return std::nullopt;
    return existing(std::filesystem::path(std::string(buf, ::strnlen(buf, len))));
#elif defined(__NetBSD__)
    return existing("/proc/curproc/exe");
#else
    // OpenBSD exposes no reliable executable path.
    return std::nullopt;
#endif
  }

 private:
  static std::optional<std::filesystem::path> existing(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec) || ec) return std::nullopt;
    return p;
  }
};

}  // namespace

std::unique_ptr<PlatformIntrospector> make_native_introspector() {
  return std::make_unique<ElfIntrospector>();
}

}  // namespace buildid

#endif  // BUILDID_PLATFORM_ELF
