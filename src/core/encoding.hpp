#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <gmpxx.h>

#include "core/digest.hpp"

namespace mk::core {

/// Bumped whenever any canonical encoding changes; prefixed to every preimage so
/// digests from different encodings never collide.
inline constexpr std::uint8_t kEncodingVersion = 0x01;

/// Canonical preimage under construction: version byte, kind tag, payload.
class Encoder {
public:
  explicit Encoder(std::uint8_t tag);

  auto u8(std::uint8_t value) -> Encoder &;
  auto u32(std::uint32_t value) -> Encoder &;
  auto u64(std::uint64_t value) -> Encoder &;
  auto f64(double value) -> Encoder &;
  /// Length-prefixed byte string.
  auto string(std::string_view value) -> Encoder &;
  /// Sign byte followed by the length-prefixed big-endian magnitude.
  auto bigint(const mpz_class &value) -> Encoder &;
  auto digest(const Digest &value) -> Encoder &;

  auto bytes() const -> std::span<const std::uint8_t> { return bytes_; }
  auto finish() const -> Digest;

private:
  std::vector<std::uint8_t> bytes_;
};

}  // namespace mk::core
