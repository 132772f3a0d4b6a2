#include "buildid/identifier.hpp"

#include "buildid/hash.hpp"

namespace buildid {
namespace {

// Byte offsets where the canonical string form places a hyphen.
constexpr std::size_t kGroupEnds[] = {4, 6, 8, 10};

}  // namespace

bool BuildIdentifier::is_nil() const {
  for (uint8_t b : bytes_) {
    if (b != 0) return false;
  }
  return true;
}

std::string BuildIdentifier::to_string() const {
  const std::string hex = to_hex();
  std::string out;
  out.reserve(kIdentifierStringLength);
  std::size_t byte = 0;
  for (std::size_t end : kGroupEnds) {
    out.append(hex, byte * 2, (end - byte) * 2);
    out.push_back('-');
    byte = end;
  }
  out.append(hex, byte * 2, std::string::npos);
  return out;
}

std::string BuildIdentifier::to_hex() const {
  return buildid::to_hex(bytes_.data(), bytes_.size());
}

std::optional<BuildIdentifier> BuildIdentifier::parse(std::string_view text) {
  std::string compact;
  if (text.size() == kIdentifierStringLength) {
    // Hyphens must sit exactly at 8, 13, 18, 23.
    compact.reserve(kIdentifierBytes * 2);
    std::size_t pos = 0;
    std::size_t byte = 0;
    for (std::size_t end : kGroupEnds) {
      const std::size_t len = (end - byte) * 2;
      compact.append(text.substr(pos, len));
      pos += len;
      if (text[pos] != '-') return std::nullopt;
      ++pos;
      byte = end;
    }
    compact.append(text.substr(pos));
  } else if (text.size() == kIdentifierBytes * 2) {
    compact.assign(text);
  } else {
    return std::nullopt;
  }

  Bytes bytes{};
  if (!from_hex(compact, bytes.data(), bytes.size())) return std::nullopt;
  return BuildIdentifier(bytes);
}

void apply_layout_bits(BuildIdentifier::Bytes& bytes) {
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | (kIdentifierVersion << 4));
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | (kIdentifierVariant << 6));
}

BuildIdentifier format_identifier(HashAccumulator& acc) {
  BuildIdentifier::Bytes bytes{};
  store_le64(acc.digest64(), bytes.data());
  acc.update_u8(kDigestDiscriminator);
  store_le64(acc.digest64(), bytes.data() + 8);
  apply_layout_bits(bytes);
  return BuildIdentifier(bytes);
}

}  // namespace buildid
