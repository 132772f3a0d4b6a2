#pragma once

// Target classification for the introspector implementations.
// Exactly one BUILDID_PLATFORM_* macro is defined to 1.

#if defined(__EMSCRIPTEN__) || defined(__wasi__) || defined(__wasm__)
#  define BUILDID_PLATFORM_UNSUPPORTED 1
#elif defined(__APPLE__) && defined(__MACH__)
#  define BUILDID_PLATFORM_MACHO 1
#elif defined(_WIN32)
#  define BUILDID_PLATFORM_PE 1
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || \
      defined(__OpenBSD__) || defined(__DragonFly__)
#  define BUILDID_PLATFORM_ELF 1
#else
#  pragma message("buildid/platform: no introspector for this target; build ids will rely on type identity only")
#  define BUILDID_PLATFORM_UNSUPPORTED 1
#endif
