#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace mk::core {

/// 256-bit content digest used as a durable cache key.
struct Digest {
  static constexpr std::size_t kSize = 32;

  std::array<std::uint8_t, kSize> bytes{};

  auto operator<=>(const Digest &) const = default;

  /// Lowercase hex rendering, two characters per byte.
  auto hex() const -> std::string;

  static auto from_hex(std::string_view text) -> Expected<Digest>;
};

/// Hash raw bytes with BLAKE3 (256-bit output).
auto hash_bytes(std::span<const std::uint8_t> payload) -> Digest;

auto hash_bytes(std::string_view payload) -> Digest;

/// Folds the first word of a digest for use in unordered containers.
struct DigestHash {
  auto operator()(const Digest &digest) const noexcept -> std::size_t {
    std::size_t value = 0;
    std::memcpy(&value, digest.bytes.data(), sizeof(value));
    return value;
  }
};

}  // namespace mk::core
