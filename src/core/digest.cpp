#include "core/digest.hpp"

#include <format>

extern "C" {
#include "blake3.h"
}

namespace mk::core {
namespace {

auto hex_value(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

auto Digest::hex() const -> std::string {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(kSize * 2);
  for (auto byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0Fu]);
  }
  return out;
}

auto Digest::from_hex(std::string_view text) -> Expected<Digest> {
  if (text.size() != kSize * 2) {
    return tl::unexpected(make_error(
        ErrorCode::Validation,
        std::format("digest hex must have {} characters, got {}", kSize * 2, text.size())));
  }
  Digest digest;
  for (std::size_t i = 0; i < kSize; ++i) {
    const auto hi = hex_value(text[2 * i]);
    const auto lo = hex_value(text[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return tl::unexpected(make_error(ErrorCode::Validation,
                                       std::format("invalid hex digit in digest '{}'", text)));
    }
    digest.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return digest;
}

auto hash_bytes(std::span<const std::uint8_t> payload) -> Digest {
  Digest digest{};
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  blake3_hasher_finalize(&hasher, digest.bytes.data(), digest.bytes.size());
  return digest;
}

auto hash_bytes(std::string_view payload) -> Digest {
  return hash_bytes(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t *>(payload.data()), payload.size()));
}

}  // namespace mk::core
