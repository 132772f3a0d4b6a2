#include "buildid/hash.hpp"

// Hash authority for the identity pipeline.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding instead of snprintf("%02x"). Identifiers are rendered on every
// handshake a consumer builds, so the formatting path stays allocation-light.

#include <array>
#include <fstream>

namespace buildid {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  const char* ver = blake3_version();
  info.version = ver ? ver : "unknown";
  info.digest_bits = 64;
  return info;
}

HashAccumulator::HashAccumulator() {
  blake3_hasher_init(&hasher_);
}

void HashAccumulator::update(const void* data, std::size_t len) {
  if (len == 0) return;
  blake3_hasher_update(&hasher_, data, len);
  bytes_absorbed_ += len;
}

void HashAccumulator::update_u64(uint64_t value) {
  uint8_t buf[8];
  store_le64(value, buf);
  update(buf, sizeof(buf));
}

uint64_t HashAccumulator::digest64() const {
  // blake3_hasher_finalize takes a const hasher; the stream stays open.
  std::array<uint8_t, 8> out{};
  blake3_hasher_finalize(&hasher_, out.data(), out.size());
  return load_le64(out.data());
}

std::optional<uint64_t> hash_file_into(const std::filesystem::path& path,
                                       HashAccumulator& acc) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  constexpr std::size_t buffer_size = 65536;  // 64KB for better I/O throughput
  char buffer[buffer_size];
  uint64_t total = 0;
  while (file.good()) {
    file.read(buffer, buffer_size);
    const std::streamsize count = file.gcount();
    if (count > 0) {
      acc.update(buffer, static_cast<std::size_t>(count));
      total += static_cast<uint64_t>(count);
    }
  }
  // eof() alone is a clean end of stream; badbit means the read failed.
  if (file.bad() || !file.eof()) {
    return std::nullopt;
  }
  return total;
}

void store_le64(uint64_t value, uint8_t* out) {
  for (std::size_t i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

uint64_t load_le64(const uint8_t* in) {
  uint64_t value = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(in[i]) << (8 * i);
  }
  return value;
}

std::string to_hex(const uint8_t* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

bool from_hex(std::string_view hex, uint8_t* out, std::size_t out_len) {
  if (hex.size() != out_len * 2) return false;
  for (std::size_t i = 0; i < out_len; ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return false;
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

}  // namespace buildid
