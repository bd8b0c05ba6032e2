#include "core/frozen_map.hpp"

#include <algorithm>
#include <atomic>
#include <format>

#include <spdlog/spdlog.h>

#include "core/canonical_hash.hpp"

namespace mk::core {

namespace detail {

struct MapStore {
  std::vector<MapEntry> entries;
  std::vector<Digest> key_digests;
};

}  // namespace detail

namespace {

auto empty_store() -> const std::shared_ptr<const detail::MapStore> & {
  static const auto empty = std::make_shared<const detail::MapStore>();
  return empty;
}

auto pair_from(const Value &item, std::size_t index) -> Expected<MapEntry> {
  const std::vector<Value> *parts = nullptr;
  if (const auto *tuple = item.get_if<Tuple>()) {
    parts = &tuple->items();
  } else if (const auto *list = item.get_if<List>()) {
    parts = &list->items();
  }
  if (!parts || parts->size() != 2) {
    return tl::unexpected(make_error(
        ErrorCode::Validation,
        std::format("frozenmap: element {} is not a key/value pair: {}", index, describe(item))));
  }
  return MapEntry{(*parts)[0], (*parts)[1]};
}

auto entries_from(const Value &source) -> Expected<std::vector<MapEntry>> {
  if (const auto *map = source.get_if<FrozenMap>()) {
    return map->entries().items();
  }
  if (const auto *dict = source.get_if<Dict>()) {
    return dict->entries();
  }
  const std::vector<Value> *items = nullptr;
  if (const auto *tuple = source.get_if<Tuple>()) {
    items = &tuple->items();
  } else if (const auto *list = source.get_if<List>()) {
    items = &list->items();
  }
  if (!items) {
    return tl::unexpected(make_error(ErrorCode::Validation,
                                     std::format("frozenmap: cannot build from {}", describe(source))));
  }
  std::vector<MapEntry> entries;
  entries.reserve(items->size());
  for (std::size_t i = 0; i < items->size(); ++i) {
    auto entry = pair_from((*items)[i], i);
    if (!entry) {
      return tl::unexpected(entry.error());
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

auto coerce_field(const Coercer &coercer, const Value &value, std::string_view type_name,
                  std::string_view field) -> Expected<Value> {
  auto result = coercer(value);
  if (!result) {
    return tl::unexpected(make_error(ErrorCode::Validation,
                                     std::format("{}: invalid {}: {}", type_name, field, result.error().message)));
  }
  return result;
}

}  // namespace

auto FrozenMapEntries::size() const -> std::size_t { return store_->entries.size(); }

auto FrozenMapEntries::items() const -> const std::vector<MapEntry> & { return store_->entries; }

auto FrozenMapEntries::key_digests() const -> const std::vector<Digest> & { return store_->key_digests; }

auto FrozenMapEntries::operator[](std::size_t index) const -> const MapEntry & {
  return store_->entries[index];
}

auto FrozenMapEntries::begin() const -> const MapEntry * { return store_->entries.data(); }

auto FrozenMapEntries::end() const -> const MapEntry * {
  return store_->entries.data() + store_->entries.size();
}

auto FrozenMapEntries::find(const Value &key) const -> const Value * {
  auto digest = canonical_hash(key);
  if (!digest) {
    return nullptr;
  }
  const auto &digests = store_->key_digests;
  const auto it = std::lower_bound(digests.begin(), digests.end(), *digest);
  if (it == digests.end() || *it != *digest) {
    return nullptr;
  }
  return &store_->entries[static_cast<std::size_t>(it - digests.begin())].value;
}

FrozenMap::FrozenMap() : store_(empty_store()) {}

FrozenMap::FrozenMap(std::shared_ptr<const detail::MapStore> store) : store_(std::move(store)) {}

FrozenMap::FrozenMap(const FrozenMap &other) : store_(other.load_store()) {}

FrozenMap::FrozenMap(FrozenMap &&other) noexcept : store_(other.load_store()) {}

auto FrozenMap::operator=(const FrozenMap &other) -> FrozenMap & {
  std::atomic_store_explicit(&store_, other.load_store(), std::memory_order_release);
  return *this;
}

auto FrozenMap::operator=(FrozenMap &&other) noexcept -> FrozenMap & {
  std::atomic_store_explicit(&store_, other.load_store(), std::memory_order_release);
  return *this;
}

FrozenMap::~FrozenMap() = default;

auto FrozenMap::load_store() const -> std::shared_ptr<const detail::MapStore> {
  return std::atomic_load_explicit(&store_, std::memory_order_acquire);
}

auto FrozenMap::size() const -> std::size_t { return load_store()->entries.size(); }

auto FrozenMap::entries() const -> FrozenMapEntries { return FrozenMapEntries(load_store()); }

auto FrozenMap::keys() const -> std::vector<Value> {
  const auto store = load_store();
  std::vector<Value> keys;
  keys.reserve(store->entries.size());
  for (const auto &entry : store->entries) {
    keys.push_back(entry.key);
  }
  return keys;
}

auto FrozenMap::find(const Value &key) const -> std::optional<Value> {
  const auto view = entries();
  if (const auto *value = view.find(key)) {
    return *value;
  }
  return std::nullopt;
}

auto FrozenMap::contains(const Value &key) const -> bool { return entries().find(key) != nullptr; }

auto FrozenMap::at(const Value &key) const -> Expected<Value> {
  auto digest = canonical_hash(key);
  if (!digest) {
    return tl::unexpected(digest.error());
  }
  const auto store = load_store();
  const auto it = std::lower_bound(store->key_digests.begin(), store->key_digests.end(), *digest);
  if (it != store->key_digests.end() && *it == *digest) {
    return store->entries[static_cast<std::size_t>(it - store->key_digests.begin())].value;
  }
  return tl::unexpected(
      make_error(ErrorCode::NotFound, std::format("frozenmap: key not found {}", key.repr())));
}

auto FrozenMap::copy() const -> Dict {
  const auto store = load_store();
  Dict dict;
  for (const auto &entry : store->entries) {
    dict.insert_or_assign(entry.key, entry.value);
  }
  return dict;
}

auto FrozenMap::set_item(const Value &key, const Value &) const -> Expected<void> {
  return tl::unexpected(make_error(ErrorCode::IllegalMutation,
                                   std::format("frozenmap does not support item assignment ({})", key.repr())));
}

auto FrozenMap::del_item(const Value &key) const -> Expected<void> {
  return tl::unexpected(make_error(ErrorCode::IllegalMutation,
                                   std::format("frozenmap does not support item deletion ({})", key.repr())));
}

auto FrozenMap::shares_store_with(const FrozenMap &other) const -> bool {
  return load_store() == other.load_store();
}

auto operator==(const FrozenMap &lhs, const FrozenMap &rhs) -> bool {
  const auto a = lhs.load_store();
  const auto b = rhs.load_store();
  if (a == b) {
    return true;
  }
  if (a->key_digests != b->key_digests) {
    return false;
  }
  for (std::size_t i = 0; i < a->entries.size(); ++i) {
    if (!(a->entries[i].value == b->entries[i].value)) {
      return false;
    }
  }
  std::atomic_store_explicit(&lhs.store_, b, std::memory_order_release);
  spdlog::trace("frozenmap: deduplicated backing store of {} entries", b->entries.size());
  return true;
}

auto make_frozen_map(std::vector<MapEntry> entries) -> Expected<FrozenMap> {
  if (entries.empty()) {
    return FrozenMap();
  }
  std::vector<std::pair<Digest, std::size_t>> order;
  order.reserve(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    auto digest = canonical_hash(entries[i].key);
    if (!digest) {
      return tl::unexpected(digest.error());
    }
    order.emplace_back(*digest, i);
  }
  std::stable_sort(order.begin(), order.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });

  auto store = std::make_shared<detail::MapStore>();
  store->entries.reserve(order.size());
  store->key_digests.reserve(order.size());
  for (auto &[digest, index] : order) {
    if (!store->key_digests.empty() && store->key_digests.back() == digest) {
      store->entries.back() = std::move(entries[index]);
      continue;
    }
    store->key_digests.push_back(digest);
    store->entries.push_back(std::move(entries[index]));
  }
  return FrozenMap(std::move(store));
}

auto make_frozen_map(std::initializer_list<MapEntry> entries) -> Expected<FrozenMap> {
  return make_frozen_map(std::vector<MapEntry>(entries));
}

auto make_frozen_map(const Value &source) -> Expected<FrozenMap> {
  if (const auto *map = source.get_if<FrozenMap>()) {
    return *map;
  }
  auto entries = entries_from(source);
  if (!entries) {
    return tl::unexpected(entries.error());
  }
  return make_frozen_map(std::move(*entries));
}

auto FrozenMapType::parametrize(const std::vector<Kind> &params) -> Expected<FrozenMapType> {
  if (params.size() != 2) {
    return tl::unexpected(make_error(
        ErrorCode::Usage,
        std::format("frozenmap expects exactly two type parameters, got {}", params.size())));
  }
  auto key = strict[params[0]];
  if (!key) {
    return tl::unexpected(key.error());
  }
  auto value = strict[params[1]];
  if (!value) {
    return tl::unexpected(value.error());
  }
  FrozenMapType type = parametrize(std::move(*key), std::move(*value));
  type.name_ = std::format("frozenmap[{}, {}]", kind_name(params[0]), kind_name(params[1]));
  return type;
}

auto FrozenMapType::parametrize(Coercer key, Coercer value) -> FrozenMapType {
  FrozenMapType type;
  type.name_ = std::format("frozenmap[{}, {}]", key.name(), value.name());
  type.key_ = std::move(key);
  type.value_ = std::move(value);
  return type;
}

auto FrozenMapType::operator()(const Value &source) const -> Expected<FrozenMap> {
  if (!key_ && !value_) {
    return make_frozen_map(source);
  }
  auto entries = entries_from(source);
  if (!entries) {
    return tl::unexpected(make_error(ErrorCode::Validation,
                                     std::format("{}: {}", name_, entries.error().message)));
  }
  for (auto &entry : *entries) {
    auto key = coerce_field(*key_, entry.key, name_, "key");
    if (!key) {
      return tl::unexpected(key.error());
    }
    auto value = coerce_field(*value_, entry.value, name_, "value");
    if (!value) {
      return tl::unexpected(value.error());
    }
    entry.key = std::move(*key);
    entry.value = std::move(*value);
  }
  return make_frozen_map(std::move(*entries));
}

}  // namespace mk::core
