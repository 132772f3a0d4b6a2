#pragma once

// buildid/identifier.hpp: 128-bit build identifier and its formatter.
//
// LAYOUT (RFC 4122 shape, IDENTIFIER_LAYOUT_VERSION = 1):
//   bytes 0..7   first 64-bit digest, little-endian
//   bytes 8..15  second 64-bit digest (after one discriminator byte),
//                little-endian
//   byte 6       high nibble overwritten with version 4
//   byte 8       top two bits overwritten with variant 0b10
//
// The version/variant overwrite is cosmetic: it lets systems that parse or
// display RFC 4122 values accept the identifier. It adds no entropy.
//
// INVARIANT: equality is bitwise. There is no meaningful ordering, so none is
// defined.

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace buildid {

class HashAccumulator;

constexpr std::size_t kIdentifierBytes = 16;
constexpr std::size_t kIdentifierStringLength = 36;
constexpr uint8_t kIdentifierVersion = 4;
constexpr uint8_t kIdentifierVariant = 0x2;  // 0b10
constexpr uint8_t kDigestDiscriminator = 0x01;

class BuildIdentifier {
 public:
  using Bytes = std::array<uint8_t, kIdentifierBytes>;

  // Nil identifier. The calculation never produces this value.
  BuildIdentifier() = default;
  explicit BuildIdentifier(const Bytes& bytes) : bytes_(bytes) {}

  const Bytes& bytes() const { return bytes_; }

  uint8_t version() const { return static_cast<uint8_t>(bytes_[6] >> 4); }
  uint8_t variant() const { return static_cast<uint8_t>(bytes_[8] >> 6); }

  bool is_nil() const;

  // True when the reserved version and variant fields hold the fixed
  // pattern every calculated identifier carries.
  bool has_build_layout() const {
    return version() == kIdentifierVersion && variant() == kIdentifierVariant;
  }

  // Canonical lowercase 8-4-4-4-12 form.
  std::string to_string() const;
  // 32 lowercase hex chars, no separators.
  std::string to_hex() const;

  // Accepts the hyphenated canonical form or 32 bare hex chars, either case.
  static std::optional<BuildIdentifier> parse(std::string_view text);

  friend bool operator==(const BuildIdentifier& a, const BuildIdentifier& b) {
    return a.bytes_ == b.bytes_;
  }
  friend bool operator!=(const BuildIdentifier& a, const BuildIdentifier& b) {
    return !(a == b);
  }

 private:
  Bytes bytes_{};
};

// Force the version nibble and variant bits into `bytes`.
void apply_layout_bits(BuildIdentifier::Bytes& bytes);

// Expand the accumulator's state into an identifier. Advances `acc` by the
// discriminator byte.
BuildIdentifier format_identifier(HashAccumulator& acc);

}  // namespace buildid

namespace std {
template <>
struct hash<buildid::BuildIdentifier> {
  size_t operator()(const buildid::BuildIdentifier& id) const noexcept {
    // Leading bytes are digest output; no further mixing needed.
    size_t h = 0;
    for (size_t i = 0; i < sizeof(size_t) && i < buildid::kIdentifierBytes; ++i) {
      h = (h << 8) | id.bytes()[i];
    }
    return h;
  }
};
}  // namespace std
