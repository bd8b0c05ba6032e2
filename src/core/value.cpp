#include "core/value.hpp"

#include <algorithm>
#include <bit>
#include <format>
#include <type_traits>

#include "core/canonical_hash.hpp"

namespace mk::core {

namespace detail {

struct SetStore {
  std::vector<Value> items;
  std::vector<Digest> digests;
};

}  // namespace detail

namespace {

auto empty_items() -> const std::shared_ptr<const std::vector<Value>> & {
  static const auto empty = std::make_shared<const std::vector<Value>>();
  return empty;
}

auto empty_set() -> const std::shared_ptr<const detail::SetStore> & {
  static const auto empty = std::make_shared<const detail::SetStore>();
  return empty;
}

auto format_float(double number) -> std::string {
  auto text = std::format("{}", number);
  if (text.find_first_not_of("-0123456789") == std::string::npos) {
    text += ".0";
  }
  return text;
}

auto quote(std::string_view text, std::string_view prefix) -> std::string {
  std::string out(prefix);
  out.push_back('\'');
  for (char c : text) {
    if (c == '\'' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

template <typename Range, typename Fn>
auto join(const Range &range, Fn &&render) -> std::string {
  std::string out;
  bool first = true;
  for (const auto &item : range) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += render(item);
  }
  return out;
}

auto same_bits(double lhs, double rhs) -> bool {
  return std::bit_cast<std::uint64_t>(lhs) == std::bit_cast<std::uint64_t>(rhs);
}

}  // namespace

auto kind_name(Kind kind) -> std::string_view {
  switch (kind) {
  case Kind::None:
    return "none";
  case Kind::Ellipsis:
    return "ellipsis";
  case Kind::Bool:
    return "bool";
  case Kind::Int:
    return "int";
  case Kind::Float:
    return "float";
  case Kind::Complex:
    return "complex";
  case Kind::Str:
    return "str";
  case Kind::Bytes:
    return "bytes";
  case Kind::Tuple:
    return "tuple";
  case Kind::FrozenSet:
    return "frozenset";
  case Kind::FrozenMap:
    return "frozenmap";
  case Kind::List:
    return "list";
  case Kind::Dict:
    return "dict";
  case Kind::Type:
    return "type";
  case Kind::Custom:
    return "custom";
  }
  return "unknown";
}

Tuple::Tuple() : items_(empty_items()) {}

Tuple::Tuple(std::initializer_list<Value> items)
    : items_(std::make_shared<const std::vector<Value>>(items)) {}

Tuple::Tuple(std::vector<Value> items)
    : items_(std::make_shared<const std::vector<Value>>(std::move(items))) {}

auto Tuple::size() const -> std::size_t { return items_->size(); }

auto Tuple::items() const -> const std::vector<Value> & { return *items_; }

auto Tuple::operator[](std::size_t index) const -> const Value & { return (*items_)[index]; }

auto Tuple::begin() const -> const Value * { return items_->data(); }

auto Tuple::end() const -> const Value * { return items_->data() + items_->size(); }

auto operator==(const Tuple &lhs, const Tuple &rhs) -> bool {
  return lhs.items_ == rhs.items_ || *lhs.items_ == *rhs.items_;
}

FrozenSet::FrozenSet() : store_(empty_set()) {}

FrozenSet::FrozenSet(std::shared_ptr<const detail::SetStore> store) : store_(std::move(store)) {}

auto FrozenSet::create(std::vector<Value> items) -> Expected<FrozenSet> {
  std::vector<std::pair<Digest, Value>> hashed;
  hashed.reserve(items.size());
  for (auto &item : items) {
    auto digest = canonical_hash(item);
    if (!digest) {
      return tl::unexpected(digest.error());
    }
    hashed.emplace_back(*digest, std::move(item));
  }
  std::stable_sort(hashed.begin(), hashed.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });
  auto store = std::make_shared<detail::SetStore>();
  for (auto &[digest, item] : hashed) {
    if (!store->digests.empty() && store->digests.back() == digest) {
      continue;
    }
    store->digests.push_back(digest);
    store->items.push_back(std::move(item));
  }
  return FrozenSet(std::move(store));
}

auto FrozenSet::size() const -> std::size_t { return store_->items.size(); }

auto FrozenSet::items() const -> const std::vector<Value> & { return store_->items; }

auto FrozenSet::digests() const -> const std::vector<Digest> & { return store_->digests; }

auto FrozenSet::contains(const Value &value) const -> bool {
  auto digest = canonical_hash(value);
  if (!digest) {
    return false;
  }
  return std::binary_search(store_->digests.begin(), store_->digests.end(), *digest);
}

auto operator==(const FrozenSet &lhs, const FrozenSet &rhs) -> bool {
  return lhs.store_ == rhs.store_ || lhs.store_->digests == rhs.store_->digests;
}

List::List(std::initializer_list<Value> items) : items_(items) {}

List::List(std::vector<Value> items) : items_(std::move(items)) {}

auto List::size() const -> std::size_t { return items_.size(); }

auto List::push_back(Value value) -> void { items_.push_back(std::move(value)); }

auto operator==(const List &lhs, const List &rhs) -> bool { return lhs.items_ == rhs.items_; }

Dict::Dict(std::initializer_list<MapEntry> entries) {
  for (const auto &entry : entries) {
    insert_or_assign(entry.key, entry.value);
  }
}

auto Dict::size() const -> std::size_t { return entries_.size(); }

auto Dict::position(const Value &key) const -> std::optional<std::size_t> {
  if (auto digest = canonical_hash(key)) {
    if (auto it = index_.find(*digest); it != index_.end()) {
      return it->second;
    }
    return std::nullopt;
  }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].key == key) {
      return i;
    }
  }
  return std::nullopt;
}

auto Dict::reindex() -> void {
  index_.clear();
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (auto digest = canonical_hash(entries_[i].key)) {
      index_.emplace(*digest, i);
    }
  }
}

auto Dict::find(const Value &key) const -> const Value * {
  auto at = position(key);
  return at ? &entries_[*at].value : nullptr;
}

auto Dict::insert_or_assign(Value key, Value value) -> void {
  auto digest = canonical_hash(key);
  if (digest) {
    if (auto it = index_.find(*digest); it != index_.end()) {
      entries_[it->second].value = std::move(value);
      return;
    }
    index_.emplace(*digest, entries_.size());
  } else if (auto at = position(key)) {
    entries_[*at].value = std::move(value);
    return;
  }
  entries_.push_back(MapEntry{std::move(key), std::move(value)});
}

auto Dict::erase(const Value &key) -> bool {
  auto at = position(key);
  if (!at) {
    return false;
  }
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*at));
  reindex();
  return true;
}

auto operator==(const Dict &lhs, const Dict &rhs) -> bool {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return std::all_of(lhs.entries_.begin(), lhs.entries_.end(), [&](const MapEntry &entry) {
    const auto *other = rhs.find(entry.key);
    return other != nullptr && *other == entry.value;
  });
}

// Equality is kind-exact and bitwise for floating point, so equal values always
// share a digest.
auto operator==(const Value &lhs, const Value &rhs) -> bool {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
      [&](const auto &a) -> bool {
        using T = std::decay_t<decltype(a)>;
        const auto &b = std::get<T>(rhs.storage_);
        if constexpr (std::is_same_v<T, double>) {
          return same_bits(a, b);
        } else if constexpr (std::is_same_v<T, Complex>) {
          return same_bits(a.real(), b.real()) && same_bits(a.imag(), b.imag());
        } else if constexpr (std::is_same_v<T, CustomRef>) {
          if (a == b) {
            return true;
          }
          return a && b && a->canonical_digest() == b->canonical_digest();
        } else {
          return a == b;
        }
      },
      lhs.storage_);
}

auto Value::repr() const -> std::string {
  return std::visit(
      [](const auto &payload) -> std::string {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, NoneType>) {
          return "None";
        } else if constexpr (std::is_same_v<T, EllipsisType>) {
          return "Ellipsis";
        } else if constexpr (std::is_same_v<T, bool>) {
          return payload ? "True" : "False";
        } else if constexpr (std::is_same_v<T, BigInt>) {
          return payload.get_str();
        } else if constexpr (std::is_same_v<T, double>) {
          return format_float(payload);
        } else if constexpr (std::is_same_v<T, Complex>) {
          const auto imag = format_float(payload.imag());
          return std::format("({}{}{}j)", format_float(payload.real()),
                             imag.starts_with('-') ? "" : "+", imag);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return quote(payload, "");
        } else if constexpr (std::is_same_v<T, Bytes>) {
          return quote(payload.data(), "b");
        } else if constexpr (std::is_same_v<T, Tuple>) {
          auto inner = join(payload, [](const Value &item) { return item.repr(); });
          return payload.size() == 1 ? "(" + inner + ",)" : "(" + inner + ")";
        } else if constexpr (std::is_same_v<T, FrozenSet>) {
          return "frozenset({" + join(payload.items(), [](const Value &item) { return item.repr(); }) +
                 "})";
        } else if constexpr (std::is_same_v<T, FrozenMap>) {
          return "frozenmap({" +
                 join(payload.entries(), [](const MapEntry &e) { return e.key.repr() + ": " + e.value.repr(); }) +
                 "})";
        } else if constexpr (std::is_same_v<T, List>) {
          return "[" + join(payload.items(), [](const Value &item) { return item.repr(); }) + "]";
        } else if constexpr (std::is_same_v<T, Dict>) {
          return "{" +
                 join(payload.entries(),
                      [](const MapEntry &e) { return e.key.repr() + ": " + e.value.repr(); }) +
                 "}";
        } else if constexpr (std::is_same_v<T, TypeValue>) {
          return std::format("<type '{}'>", kind_name(payload.kind));
        } else {
          return payload ? std::format("<{}>", payload->type_name()) : std::string("<null custom>");
        }
      },
      storage_);
}

auto describe(const Value &value) -> std::string {
  return std::format("{} ({})", value.repr(), kind_name(value.kind()));
}

}  // namespace mk::core
