#pragma once

#include <span>
#include <vector>

#include "core/digest.hpp"
#include "core/error.hpp"
#include "core/value.hpp"

namespace mk::core {

/// Digest of a value, dispatched on its exact kind. Stable across processes:
/// suitable as a durable cache key. Mutable containers fail with Unhashable.
auto canonical_hash(const Value &value) -> Expected<Digest>;

/// Digest of a key/value pair as used inside FrozenMap hashing.
auto hash_pair(const Digest &key, const Digest &value) -> Digest;

/// Order-sensitive combination of element digests under the tuple tag.
auto hash_ordered(std::span<const Digest> items) -> Digest;

/// Order-insensitive combination of element digests under the set tag.
auto hash_unordered(std::vector<Digest> items) -> Digest;

}  // namespace mk::core
