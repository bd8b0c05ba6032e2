#include "core/encoding.hpp"

#include <array>
#include <bit>
#include <limits>
#include <stdexcept>

namespace mk::core {
namespace {

auto write_u32_le(std::vector<std::uint8_t> &out, std::uint32_t value) -> void {
  std::array<std::uint8_t, 4> bytes{
      static_cast<std::uint8_t>(value & 0xFFu),
      static_cast<std::uint8_t>((value >> 8) & 0xFFu),
      static_cast<std::uint8_t>((value >> 16) & 0xFFu),
      static_cast<std::uint8_t>((value >> 24) & 0xFFu)};
  out.insert(out.end(), bytes.begin(), bytes.end());
}

auto write_u64_le(std::vector<std::uint8_t> &out, std::uint64_t value) -> void {
  for (int shift = 0; shift < 64; shift += 8) {
    out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
  }
}

auto checked_size(std::size_t size) -> std::uint32_t {
  if (size > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("canonical encoding field too large");
  }
  return static_cast<std::uint32_t>(size);
}

}  // namespace

Encoder::Encoder(std::uint8_t tag) {
  bytes_.push_back(kEncodingVersion);
  bytes_.push_back(tag);
}

auto Encoder::u8(std::uint8_t value) -> Encoder & {
  bytes_.push_back(value);
  return *this;
}

auto Encoder::u32(std::uint32_t value) -> Encoder & {
  write_u32_le(bytes_, value);
  return *this;
}

auto Encoder::u64(std::uint64_t value) -> Encoder & {
  write_u64_le(bytes_, value);
  return *this;
}

auto Encoder::f64(double value) -> Encoder & {
  write_u64_le(bytes_, std::bit_cast<std::uint64_t>(value));
  return *this;
}

auto Encoder::string(std::string_view value) -> Encoder & {
  write_u32_le(bytes_, checked_size(value.size()));
  bytes_.insert(bytes_.end(), value.begin(), value.end());
  return *this;
}

auto Encoder::bigint(const mpz_class &value) -> Encoder & {
  const int sign = sgn(value);
  bytes_.push_back(sign < 0 ? 0x01 : (sign == 0 ? 0x00 : 0x02));
  std::vector<std::uint8_t> magnitude((mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8);
  std::size_t count = 0;
  mpz_export(magnitude.data(), &count, 1, 1, 1, 0, value.get_mpz_t());
  write_u32_le(bytes_, checked_size(count));
  bytes_.insert(bytes_.end(), magnitude.begin(), magnitude.begin() + static_cast<std::ptrdiff_t>(count));
  return *this;
}

auto Encoder::digest(const Digest &value) -> Encoder & {
  bytes_.insert(bytes_.end(), value.bytes.begin(), value.bytes.end());
  return *this;
}

auto Encoder::finish() const -> Digest { return hash_bytes(bytes_); }

}  // namespace mk::core
