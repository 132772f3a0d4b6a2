#pragma once

// buildid/platform.hpp: Binary self-introspection capability layer.
//
// One PlatformIntrospector implementation per binary format family:
//   elf           Linux, Android, the BSDs   (NT_GNU_BUILD_ID note)
//   mach_o        macOS, iOS                 (LC_UUID load command)
//   pe            Windows                    (CodeView RSDS GUID + age)
//   unsupported   WebAssembly and unknown targets; every query fails fast
//
// PLATFORM GUARDS:
//   Target detection lives in src/platform_detect.hpp and nowhere else. Each
//   implementation file is guarded as a whole; exactly one of them defines
//   make_native_introspector() for a given target. The selection algorithm
//   (selector.cpp) contains no conditional compilation.
//
// CONTRACT:
//   Introspectors never throw and never abort. Absence of a capability is
//   reported as nullopt and handled by the selector's fallback chain.

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace buildid {

enum class PlatformFamily {
  elf,
  mach_o,
  pe,
  unsupported,
};

std::string to_string(PlatformFamily family);

class PlatformIntrospector {
 public:
  virtual ~PlatformIntrospector() = default;

  virtual PlatformFamily family() const = 0;

  // Raw linker-embedded build identifier bytes of the running executable.
  // nullopt when the format carries none or it is empty.
  virtual std::optional<std::string> embedded_build_id() const = 0;

  // Openable filesystem path of the running executable, or nullopt when the
  // environment has no addressable executable file.
  virtual std::optional<std::filesystem::path> executable_path() const = 0;
};

// Introspector for the compilation target.
std::unique_ptr<PlatformIntrospector> make_native_introspector();

// Always-failing introspector. Used on unsupported targets and to simulate a
// fully sandboxed environment.
std::unique_ptr<PlatformIntrospector> make_unsupported_introspector();

// Process-wide native introspector instance (stateless, created once).
const PlatformIntrospector& native_introspector();

}  // namespace buildid
