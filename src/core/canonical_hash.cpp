#include "core/canonical_hash.hpp"

#include <algorithm>
#include <format>
#include <type_traits>

#include "core/encoding.hpp"

namespace mk::core {
namespace {

enum Tag : std::uint8_t {
  kTagNone = 0x01,
  kTagEllipsis = 0x02,
  kTagFalse = 0x03,
  kTagTrue = 0x04,
  kTagInt = 0x05,
  kTagFloat = 0x06,
  kTagComplex = 0x07,
  kTagStr = 0x08,
  kTagBytes = 0x09,
  kTagTuple = 0x0A,
  kTagFrozenSet = 0x0B,
  kTagFrozenMap = 0x0C,
  kTagMapPair = 0x0D,
  kTagType = 0x0E,
};

auto combine_sorted(std::uint8_t tag, std::vector<Digest> items) -> Digest {
  std::sort(items.begin(), items.end());
  Encoder encoder(tag);
  encoder.u64(items.size());
  for (const auto &item : items) {
    encoder.digest(item);
  }
  return encoder.finish();
}

auto hash_items(const std::vector<Value> &items) -> Expected<std::vector<Digest>> {
  std::vector<Digest> digests;
  digests.reserve(items.size());
  for (const auto &item : items) {
    auto digest = canonical_hash(item);
    if (!digest) {
      return tl::unexpected(digest.error());
    }
    digests.push_back(*digest);
  }
  return digests;
}

auto hash_frozen_map(const FrozenMap &map) -> Expected<Digest> {
  std::vector<Digest> pairs;
  const auto entries = map.entries();
  const auto &keys = entries.key_digests();
  pairs.reserve(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    auto value = canonical_hash(entries[i].value);
    if (!value) {
      return tl::unexpected(value.error());
    }
    pairs.push_back(hash_pair(keys[i], *value));
  }
  return combine_sorted(kTagFrozenMap, std::move(pairs));
}

auto unhashable(Kind kind) -> Error {
  return make_error(ErrorCode::Unhashable,
                    std::format("unhashable value of kind '{}'", kind_name(kind)));
}

}  // namespace

auto hash_pair(const Digest &key, const Digest &value) -> Digest {
  return Encoder(kTagMapPair).digest(key).digest(value).finish();
}

auto hash_ordered(std::span<const Digest> items) -> Digest {
  Encoder encoder(kTagTuple);
  encoder.u64(items.size());
  for (const auto &item : items) {
    encoder.digest(item);
  }
  return encoder.finish();
}

auto hash_unordered(std::vector<Digest> items) -> Digest {
  return combine_sorted(kTagFrozenSet, std::move(items));
}

auto canonical_hash(const Value &value) -> Expected<Digest> {
  return std::visit(
      [&](const auto &payload) -> Expected<Digest> {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, NoneType>) {
          return Encoder(kTagNone).finish();
        } else if constexpr (std::is_same_v<T, EllipsisType>) {
          return Encoder(kTagEllipsis).finish();
        } else if constexpr (std::is_same_v<T, bool>) {
          return Encoder(payload ? kTagTrue : kTagFalse).finish();
        } else if constexpr (std::is_same_v<T, BigInt>) {
          return Encoder(kTagInt).bigint(payload).finish();
        } else if constexpr (std::is_same_v<T, double>) {
          return Encoder(kTagFloat).f64(payload).finish();
        } else if constexpr (std::is_same_v<T, Complex>) {
          return Encoder(kTagComplex).f64(payload.real()).f64(payload.imag()).finish();
        } else if constexpr (std::is_same_v<T, std::string>) {
          return Encoder(kTagStr).string(payload).finish();
        } else if constexpr (std::is_same_v<T, Bytes>) {
          return Encoder(kTagBytes).string(payload.data()).finish();
        } else if constexpr (std::is_same_v<T, Tuple>) {
          auto digests = hash_items(payload.items());
          if (!digests) {
            return tl::unexpected(digests.error());
          }
          return hash_ordered(*digests);
        } else if constexpr (std::is_same_v<T, FrozenSet>) {
          return hash_unordered(payload.digests());
        } else if constexpr (std::is_same_v<T, FrozenMap>) {
          return hash_frozen_map(payload);
        } else if constexpr (std::is_same_v<T, TypeValue>) {
          return Encoder(kTagType).u8(static_cast<std::uint8_t>(payload.kind)).finish();
        } else if constexpr (std::is_same_v<T, CustomRef>) {
          if (!payload) {
            return tl::unexpected(unhashable(Kind::Custom));
          }
          return payload->canonical_digest();
        } else {
          return tl::unexpected(unhashable(value.kind()));
        }
      },
      value.storage());
}

}  // namespace mk::core
