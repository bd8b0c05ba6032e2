#include "core/cache_class.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace mk::core {

auto member_kind_name(MemberKind kind) -> std::string_view {
  switch (kind) {
  case MemberKind::Property:
    return "property";
  case MemberKind::Method:
    return "method";
  case MemberKind::Field:
    return "field";
  }
  return "unknown";
}

auto is_private_name(std::string_view name) -> bool {
  return name.size() > 2 && name.starts_with("__") && !name.ends_with("__");
}

auto CacheSlots::find_property(std::size_t slot) const -> std::optional<Value> {
  std::lock_guard lock(mutex_);
  return slots_[slot].property;
}

auto CacheSlots::store_property(std::size_t slot, Value value) -> Value {
  std::lock_guard lock(mutex_);
  auto &stored = slots_[slot].property;
  if (!stored) {
    stored = std::move(value);
  }
  return *stored;
}

auto CacheSlots::find_call(std::size_t slot, const Digest &key) const -> std::optional<Value> {
  std::lock_guard lock(mutex_);
  const auto &calls = slots_[slot].calls;
  if (auto it = calls.find(key); it != calls.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto CacheSlots::store_call(std::size_t slot, const Digest &key, Value value) -> Value {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = slots_[slot].calls.try_emplace(key, std::move(value));
  return it->second;
}

auto CacheSlots::call_count(std::size_t slot) const -> std::size_t {
  std::lock_guard lock(mutex_);
  return slots_[slot].calls.size();
}

CacheHost::CacheHost(std::shared_ptr<const CacheClass> cls)
    : class_(std::move(cls)), slots_(class_->slot_count()) {}

auto CacheHost::get(std::string_view name) const -> Expected<Value> { return class_->get(*this, name); }

auto CacheHost::call(std::string_view name, const CallArgs &args) const -> Expected<Value> {
  return class_->call(*this, name, args);
}

auto CacheHost::set(std::string_view name, const Value &value) const -> Expected<void> {
  return class_->set(*this, name, value);
}

auto CacheHost::del(std::string_view name) const -> Expected<void> { return class_->del(*this, name); }

auto CacheClass::is_subclass_of(const CacheClass &other) const -> bool {
  for (const auto *cls = this; cls != nullptr; cls = cls->base_.get()) {
    if (cls == &other) {
      return true;
    }
  }
  return false;
}

auto CacheClass::resolve(std::string_view name) const -> const Member * {
  auto own = std::find_if(members_.begin(), members_.end(),
                          [&](const Member &member) { return member.name == name; });
  if (own != members_.end()) {
    return &*own;
  }
  if (is_private_name(name) || !base_) {
    return nullptr;
  }
  return base_->resolve(name);
}

auto CacheClass::is_cached(std::string_view name) const -> bool {
  const auto *member = resolve(name);
  return member != nullptr && member->slot.has_value();
}

auto CacheClass::missing(std::string_view name) const -> Error {
  return make_error(ErrorCode::NotFound, std::format("'{}' object has no attribute '{}'", name_, name));
}

auto CacheClass::check_host(const CacheHost &host) const -> Expected<void> {
  if (!host.cache_class().is_subclass_of(*this)) {
    return tl::unexpected(make_error(ErrorCode::Usage,
                                     std::format("'{}' attribute lookup on an instance of unrelated class '{}'",
                                                 name_, host.cache_class().name())));
  }
  return {};
}

auto CacheClass::get(const CacheHost &host, std::string_view name) const -> Expected<Value> {
  if (auto checked = check_host(host); !checked) {
    return tl::unexpected(checked.error());
  }
  const auto *member = resolve(name);
  if (member == nullptr) {
    return tl::unexpected(missing(name));
  }
  switch (member->kind) {
  case MemberKind::Field:
    return member->field;
  case MemberKind::Method:
    return tl::unexpected(
        make_error(ErrorCode::Usage, std::format("attribute '{}' is a method; use call", name)));
  case MemberKind::Property:
    break;
  }
  if (!member->slot) {
    return member->property(host);
  }
  auto &slots = host.slots();
  if (auto hit = slots.find_property(*member->slot)) {
    return std::move(*hit);
  }
  spdlog::trace("cache miss: {}.{}", name_, name);
  auto computed = member->property(host);
  if (!computed) {
    return tl::unexpected(computed.error());
  }
  return slots.store_property(*member->slot, std::move(*computed));
}

auto CacheClass::call(const CacheHost &host, std::string_view name, const CallArgs &args) const
    -> Expected<Value> {
  if (auto checked = check_host(host); !checked) {
    return tl::unexpected(checked.error());
  }
  const auto *member = resolve(name);
  if (member == nullptr) {
    return tl::unexpected(missing(name));
  }
  if (member->kind != MemberKind::Method) {
    return tl::unexpected(make_error(
        ErrorCode::Usage, std::format("{} '{}' is not callable", member_kind_name(member->kind), name)));
  }
  auto bound = member->signature->normalize(args);
  if (!bound) {
    return tl::unexpected(bound.error());
  }
  if (!member->slot) {
    return member->method(host, *bound);
  }
  auto key = bound->key();
  if (!key) {
    return tl::unexpected(key.error());
  }
  auto &slots = host.slots();
  if (auto hit = slots.find_call(*member->slot, *key)) {
    return std::move(*hit);
  }
  spdlog::trace("cache miss: {}.{} key={}", name_, name, key->hex());
  auto computed = member->method(host, *bound);
  if (!computed) {
    return tl::unexpected(computed.error());
  }
  return slots.store_call(*member->slot, *key, std::move(*computed));
}

auto CacheClass::set(const CacheHost &host, std::string_view name, const Value &) const -> Expected<void> {
  if (auto checked = check_host(host); !checked) {
    return checked;
  }
  const auto *member = resolve(name);
  if (member == nullptr) {
    return tl::unexpected(missing(name));
  }
  return tl::unexpected(make_error(ErrorCode::IllegalMutation,
                                   std::format("can't set {} '{}'", member_kind_name(member->kind), name)));
}

auto CacheClass::del(const CacheHost &host, std::string_view name) const -> Expected<void> {
  if (auto checked = check_host(host); !checked) {
    return checked;
  }
  const auto *member = resolve(name);
  if (member == nullptr) {
    return tl::unexpected(missing(name));
  }
  return tl::unexpected(make_error(
      ErrorCode::IllegalMutation, std::format("can't delete {} '{}'", member_kind_name(member->kind), name)));
}

auto CacheClassBuilder::wrong_host(std::string_view attr) -> Error {
  return make_error(ErrorCode::Usage, std::format("attribute '{}' accessed on an instance of another class", attr));
}

auto CacheClassBuilder::build() && -> Expected<std::shared_ptr<const CacheClass>> {
  if (error_) {
    return tl::unexpected(std::move(*error_));
  }
  std::unordered_set<std::string> names;
  for (const auto &member : members_) {
    if (!names.insert(member.name).second) {
      return tl::unexpected(make_error(ErrorCode::Usage, std::format("duplicate attribute '{}'", member.name)));
    }
  }

  std::size_t next_slot = base_ ? base_->slot_count() : 0;
  for (const auto &attr : cached_) {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const CacheClass::Member &member) { return member.name == attr; });
    if (it == members_.end()) {
      return tl::unexpected(
          make_error(ErrorCode::Usage, std::format("attribute listed in cache is undefined: {}", attr)));
    }
    if (it->kind == MemberKind::Field) {
      return tl::unexpected(make_error(
          ErrorCode::Usage,
          std::format("don't know how to cache attribute {}: {}", attr, member_kind_name(it->kind))));
    }
    if (!it->slot) {
      it->slot = next_slot++;
    }
  }

  std::shared_ptr<CacheClass> cls(new CacheClass());
  cls->name_ = std::move(name_);
  cls->base_ = std::move(base_);
  cls->members_ = std::move(members_);
  cls->slot_count_ = next_slot;
  spdlog::debug("cache class {}: {} members, {} cached, {} slots", cls->name_, cls->members_.size(),
                cached_.size(), cls->slot_count_);
  return cls;
}

}  // namespace mk::core
