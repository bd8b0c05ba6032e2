#pragma once

#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <gmpxx.h>

#include "core/digest.hpp"
#include "core/error.hpp"

namespace mk::core {

/// Exact runtime category of a Value. The order matches Value::Storage.
enum class Kind : std::uint8_t {
  None,
  Ellipsis,
  Bool,
  Int,
  Float,
  Complex,
  Str,
  Bytes,
  Tuple,
  FrozenSet,
  FrozenMap,
  List,
  Dict,
  Type,
  Custom,
};

inline constexpr std::size_t kKindCount = static_cast<std::size_t>(Kind::Custom) + 1;

auto kind_name(Kind kind) -> std::string_view;

struct NoneType {
  auto operator==(const NoneType &) const -> bool = default;
};

struct EllipsisType {
  auto operator==(const EllipsisType &) const -> bool = default;
};

inline constexpr NoneType None{};
inline constexpr EllipsisType Ellipsis{};

using BigInt = mpz_class;
using Complex = std::complex<double>;

/// Raw byte string, kept apart from UTF-8 text.
class Bytes {
public:
  Bytes() = default;
  explicit Bytes(std::string data) : data_(std::move(data)) {}

  auto data() const -> std::string_view { return data_; }
  auto size() const -> std::size_t { return data_.size(); }

  auto operator==(const Bytes &) const -> bool = default;

private:
  std::string data_;
};

/// A kind used as a value (hashing the type `int` rather than an int).
struct TypeValue {
  Kind kind = Kind::None;

  auto operator==(const TypeValue &) const -> bool = default;
};

/// Opt-in capability for user types that define their own canonical digest.
class CustomHashable {
public:
  virtual ~CustomHashable() = default;

  virtual auto canonical_digest() const -> Digest = 0;
  virtual auto type_name() const -> std::string_view = 0;
};

using CustomRef = std::shared_ptr<const CustomHashable>;

class Value;
class Dict;
struct MapEntry;

namespace detail {
struct SetStore;
struct MapStore;
}  // namespace detail

/// Immutable ordered sequence.
class Tuple {
public:
  Tuple();
  Tuple(std::initializer_list<Value> items);
  explicit Tuple(std::vector<Value> items);

  auto size() const -> std::size_t;
  auto empty() const -> bool { return size() == 0; }
  auto items() const -> const std::vector<Value> &;
  auto operator[](std::size_t index) const -> const Value &;
  auto begin() const -> const Value *;
  auto end() const -> const Value *;

  friend auto operator==(const Tuple &lhs, const Tuple &rhs) -> bool;

private:
  std::shared_ptr<const std::vector<Value>> items_;
};

/// Immutable set of hashable values, kept sorted by element digest.
class FrozenSet {
public:
  FrozenSet();

  static auto create(std::vector<Value> items) -> Expected<FrozenSet>;

  auto size() const -> std::size_t;
  auto empty() const -> bool { return size() == 0; }
  auto items() const -> const std::vector<Value> &;
  auto digests() const -> const std::vector<Digest> &;
  auto contains(const Value &value) const -> bool;

  friend auto operator==(const FrozenSet &lhs, const FrozenSet &rhs) -> bool;

private:
  explicit FrozenSet(std::shared_ptr<const detail::SetStore> store);

  std::shared_ptr<const detail::SetStore> store_;
};

/// Entries of one FrozenMap backing store. The view owns a reference to that
/// store, so pointers taken from it stay valid for the view's lifetime even when
/// the map it came from adopts another store.
class FrozenMapEntries {
public:
  auto size() const -> std::size_t;
  auto empty() const -> bool { return size() == 0; }
  auto items() const -> const std::vector<MapEntry> &;
  auto key_digests() const -> const std::vector<Digest> &;
  auto operator[](std::size_t index) const -> const MapEntry &;
  auto begin() const -> const MapEntry *;
  auto end() const -> const MapEntry *;
  /// Null when the key is absent or unhashable.
  auto find(const Value &key) const -> const Value *;

private:
  friend class FrozenMap;

  explicit FrozenMapEntries(std::shared_ptr<const detail::MapStore> store) : store_(std::move(store)) {}

  std::shared_ptr<const detail::MapStore> store_;
};

/// Immutable mapping with order-insensitive equality. See core/frozen_map.hpp for
/// construction.
class FrozenMap {
public:
  FrozenMap();
  FrozenMap(const FrozenMap &other);
  FrozenMap(FrozenMap &&other) noexcept;
  auto operator=(const FrozenMap &other) -> FrozenMap &;
  auto operator=(FrozenMap &&other) noexcept -> FrozenMap &;
  ~FrozenMap();

  auto size() const -> std::size_t;
  auto empty() const -> bool { return size() == 0; }

  /// Entries sorted by key digest. The order is not meaningful to callers.
  auto entries() const -> FrozenMapEntries;
  auto keys() const -> std::vector<Value>;

  auto contains(const Value &key) const -> bool;
  /// Empty when the key is absent or unhashable.
  auto find(const Value &key) const -> std::optional<Value>;
  auto at(const Value &key) const -> Expected<Value>;

  /// Mutable snapshot with equal contents.
  auto copy() const -> Dict;

  auto set_item(const Value &key, const Value &value) const -> Expected<void>;
  auto del_item(const Value &key) const -> Expected<void>;

  /// Equal contents; on success `lhs` adopts the backing store of `rhs`.
  friend auto operator==(const FrozenMap &lhs, const FrozenMap &rhs) -> bool;

  auto shares_store_with(const FrozenMap &other) const -> bool;

private:
  explicit FrozenMap(std::shared_ptr<const detail::MapStore> store);

  auto load_store() const -> std::shared_ptr<const detail::MapStore>;

  mutable std::shared_ptr<const detail::MapStore> store_;

  friend auto make_frozen_map(std::vector<MapEntry> entries) -> Expected<FrozenMap>;
};

/// Mutable list; never hashable.
class List {
public:
  List() = default;
  List(std::initializer_list<Value> items);
  explicit List(std::vector<Value> items);

  auto size() const -> std::size_t;
  auto items() const -> const std::vector<Value> & { return items_; }
  auto push_back(Value value) -> void;

  friend auto operator==(const List &lhs, const List &rhs) -> bool;

private:
  std::vector<Value> items_;
};

/// Mutable insertion-ordered mapping; never hashable.
class Dict {
public:
  Dict() = default;
  Dict(std::initializer_list<MapEntry> entries);

  auto size() const -> std::size_t;
  auto empty() const -> bool { return size() == 0; }
  auto entries() const -> const std::vector<MapEntry> & { return entries_; }
  auto find(const Value &key) const -> const Value *;
  auto insert_or_assign(Value key, Value value) -> void;
  auto erase(const Value &key) -> bool;

  friend auto operator==(const Dict &lhs, const Dict &rhs) -> bool;

private:
  auto position(const Value &key) const -> std::optional<std::size_t>;
  auto reindex() -> void;

  std::vector<MapEntry> entries_;
  // Positions of hashable keys by digest; unhashable keys are found by scanning.
  std::unordered_map<Digest, std::size_t, DigestHash> index_;
};

class Value {
public:
  using Storage = std::variant<NoneType, EllipsisType, bool, BigInt, double, Complex,
                               std::string, Bytes, Tuple, FrozenSet, FrozenMap, List, Dict,
                               TypeValue, CustomRef>;

  Value() = default;
  Value(NoneType) {}
  Value(EllipsisType) : storage_(std::in_place_type<EllipsisType>) {}

  template <typename B>
    requires std::same_as<B, bool>
  Value(B flag) : storage_(std::in_place_type<bool>, flag) {}

  template <std::integral I>
    requires(!std::same_as<I, bool> && !std::same_as<I, char>)
  Value(I number) : storage_(std::in_place_type<BigInt>, to_bigint(number)) {}

  template <std::floating_point F>
  Value(F number) : storage_(std::in_place_type<double>, static_cast<double>(number)) {}

  Value(BigInt number) : storage_(std::in_place_type<BigInt>, std::move(number)) {}
  Value(Complex number) : storage_(std::in_place_type<Complex>, number) {}
  Value(std::string text) : storage_(std::in_place_type<std::string>, std::move(text)) {}
  Value(std::string_view text) : storage_(std::in_place_type<std::string>, text) {}
  Value(const char *text) : storage_(std::in_place_type<std::string>, text) {}
  Value(Bytes bytes) : storage_(std::in_place_type<Bytes>, std::move(bytes)) {}
  Value(Tuple tuple) : storage_(std::in_place_type<Tuple>, std::move(tuple)) {}
  Value(FrozenSet set) : storage_(std::in_place_type<FrozenSet>, std::move(set)) {}
  Value(FrozenMap map) : storage_(std::in_place_type<FrozenMap>, std::move(map)) {}
  Value(List list) : storage_(std::in_place_type<List>, std::move(list)) {}
  Value(Dict dict) : storage_(std::in_place_type<Dict>, std::move(dict)) {}
  Value(TypeValue type) : storage_(std::in_place_type<TypeValue>, type) {}
  Value(CustomRef custom) : storage_(std::in_place_type<CustomRef>, std::move(custom)) {}

  template <typename T>
    requires std::derived_from<T, CustomHashable>
  Value(std::shared_ptr<T> custom)
      : storage_(std::in_place_type<CustomRef>, CustomRef(std::move(custom))) {}

  auto kind() const -> Kind { return static_cast<Kind>(storage_.index()); }

  auto is_none() const -> bool { return kind() == Kind::None; }

  template <typename T>
  auto is() const -> bool {
    return std::holds_alternative<T>(storage_);
  }

  template <typename T>
  auto as() const -> const T & {
    return std::get<T>(storage_);
  }

  template <typename T>
  auto get_if() const -> const T * {
    return std::get_if<T>(&storage_);
  }

  auto storage() const -> const Storage & { return storage_; }

  /// Python-like rendering used in diagnostics.
  auto repr() const -> std::string;

  friend auto operator==(const Value &lhs, const Value &rhs) -> bool;

private:
  template <std::integral I>
  static auto to_bigint(I number) -> BigInt {
    if constexpr (std::is_signed_v<I>) {
      return BigInt(static_cast<long>(number));
    } else {
      return BigInt(static_cast<unsigned long>(number));
    }
  }

  Storage storage_;
};

struct MapEntry {
  Value key;
  Value value;
};

inline auto type_of(Kind kind) -> Value { return Value(TypeValue{kind}); }

/// Renders "<repr> (<kind>)" for error messages.
auto describe(const Value &value) -> std::string;

}  // namespace mk::core
