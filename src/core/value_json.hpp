#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/error.hpp"
#include "core/value.hpp"

namespace mk::core {

using Json = nlohmann::json;

/// Tagged encoding that preserves kinds: every value becomes a one-member
/// object keyed by its kind name, e.g. {"int": "12"} or {"tuple": [...]}.
/// Custom values have no encoding.
auto encode_json(const Value &value) -> Expected<Json>;
auto decode_json(const Json &json) -> Expected<Value>;

/// Untagged JSON as written by people: objects become FrozenMaps with str keys,
/// arrays become Tuples.
auto from_plain_json(const Json &json) -> Expected<Value>;

auto serialize(const FrozenMap &map) -> Expected<std::string>;
auto restore_frozen_map(std::string_view text) -> Expected<FrozenMap>;

}  // namespace mk::core
