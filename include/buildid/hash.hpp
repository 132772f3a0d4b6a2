#pragma once

// buildid/hash.hpp: Streaming hash accumulator for build identity sources.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. The identifier pipeline consumes a
//      64-bit view of it: digest64() is the first 8 bytes of the BLAKE3
//      output, read little-endian.
//   2. digest64() is non-destructive. Reading a digest never ends the stream,
//      so the formatter can extract, append a discriminator, and extract again
//      from one accumulator.
//   3. Multi-byte integers are always absorbed little-endian so identifiers
//      are stable across host byte orders.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Bump version::HASH_ALGORITHM_VERSION when the primitive or the truncation
//   rule changes. Peers comparing identifiers built with different versions
//   will always disagree.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace buildid {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  uint32_t digest_bits{64};
};

HashRuntimeInfo hash_runtime_info();

// Copyable streaming hash state. Exists only for the duration of one
// calculation; never retained.
class HashAccumulator {
 public:
  HashAccumulator();

  void update(const void* data, std::size_t len);
  void update(std::string_view bytes) { update(bytes.data(), bytes.size()); }
  void update_u8(uint8_t value) { update(&value, 1); }
  void update_u64(uint64_t value);

  uint64_t digest64() const;
  uint64_t bytes_absorbed() const { return bytes_absorbed_; }

 private:
  blake3_hasher hasher_;
  uint64_t bytes_absorbed_{0};
};

// Stream the whole file at `path` into `acc`.
// Returns the number of bytes absorbed, or nullopt if the file cannot be
// opened or a read error occurs. On nullopt `acc` may hold a partial prefix.
std::optional<uint64_t> hash_file_into(const std::filesystem::path& path,
                                       HashAccumulator& acc);

// Little-endian packing helpers.
void store_le64(uint64_t value, uint8_t* out);
uint64_t load_le64(const uint8_t* in);

std::string to_hex(const uint8_t* data, std::size_t len);

// Decode exactly out_len bytes from hex (either case). False on any invalid
// character or length mismatch; `out` is unspecified on failure.
bool from_hex(std::string_view hex, uint8_t* out, std::size_t out_len);

}  // namespace buildid
