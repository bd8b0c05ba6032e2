#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "core/strict.hpp"
#include "core/value.hpp"

namespace mk::core {

namespace frozen_map::detail {

template <typename T>
concept PairLike = requires(const T &pair) {
  Value(pair.first);
  Value(pair.second);
};

}  // namespace frozen_map::detail

/// Builds a FrozenMap; a key given twice keeps its last value. Keys must be
/// hashable.
auto make_frozen_map(std::vector<MapEntry> entries) -> Expected<FrozenMap>;

auto make_frozen_map(std::initializer_list<MapEntry> entries) -> Expected<FrozenMap>;

/// Accepts a Dict, another FrozenMap, or a Tuple/List of two-element pairs.
auto make_frozen_map(const Value &source) -> Expected<FrozenMap>;

class FrozenMapBuilder {
  std::vector<MapEntry> pending_;

public:
  explicit FrozenMapBuilder(std::size_t reserve = 0) {
    if (reserve > 0) {
      pending_.reserve(reserve);
    }
  }

  auto reserve(std::size_t n) -> FrozenMapBuilder & {
    pending_.reserve(n);
    return *this;
  }

  auto insert(Value key, Value value) -> FrozenMapBuilder & {
    pending_.push_back(MapEntry{std::move(key), std::move(value)});
    return *this;
  }

  template <std::input_iterator It>
    requires frozen_map::detail::PairLike<std::iter_value_t<It>>
  auto insert(It first, It last) -> FrozenMapBuilder & {
    for (auto it = first; it != last; ++it) {
      pending_.push_back(MapEntry{Value(it->first), Value(it->second)});
    }
    return *this;
  }

  [[nodiscard]] auto build() && -> Expected<FrozenMap> {
    return make_frozen_map(std::move(pending_));
  }
};

/// Any range of pair-likes, e.g. a std::map<std::string, double>.
template <std::ranges::input_range R>
  requires frozen_map::detail::PairLike<std::ranges::range_value_t<R>>
auto make_frozen_map_from(R &&range) -> Expected<FrozenMap> {
  FrozenMapBuilder builder;
  builder.insert(std::ranges::begin(range), std::ranges::end(range));
  return std::move(builder).build();
}

/// `frozenmap[K, V]`: coerces every key through strict[K] and every value
/// through strict[V]. Default-constructed it builds without coercion.
class FrozenMapType {
public:
  FrozenMapType() = default;

  static auto parametrize(const std::vector<Kind> &params) -> Expected<FrozenMapType>;
  static auto parametrize(Coercer key, Coercer value) -> FrozenMapType;

  auto operator()(const Value &source) const -> Expected<FrozenMap>;

  auto name() const -> const std::string & { return name_; }

private:
  std::optional<Coercer> key_;
  std::optional<Coercer> value_;
  std::string name_ = "frozenmap";
};

}  // namespace mk::core
