#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/annotate.hpp"
#include "core/digest.hpp"
#include "core/error.hpp"
#include "core/signature.hpp"
#include "core/value.hpp"

namespace mk::core {

class CacheClass;
class CacheHost;

enum class MemberKind {
  Property,
  Method,
  Field,
};

auto member_kind_name(MemberKind kind) -> std::string_view;

/// Names with a leading "__" and no trailing "__" are visible only to the class
/// that declares them.
auto is_private_name(std::string_view name) -> bool;

/// Per-instance memo storage, one slot per cached attribute of the class chain.
/// The mutex guards the containers only; bodies run unlocked, so racing misses
/// may both compute and the first stored result wins.
class CacheSlots {
public:
  explicit CacheSlots(std::size_t count) : slots_(count) {}

  auto size() const -> std::size_t { return slots_.size(); }

  auto find_property(std::size_t slot) const -> std::optional<Value>;
  /// Returns the value that ends up stored.
  auto store_property(std::size_t slot, Value value) -> Value;

  auto find_call(std::size_t slot, const Digest &key) const -> std::optional<Value>;
  auto store_call(std::size_t slot, const Digest &key, Value value) -> Value;
  auto call_count(std::size_t slot) const -> std::size_t;

private:
  struct Slot {
    std::optional<Value> property;
    std::unordered_map<Digest, Value, DigestHash> calls;
  };

  mutable std::mutex mutex_;
  std::vector<Slot> slots_;
};

/// Base of every instance of a CacheClass.
class CacheHost {
public:
  explicit CacheHost(std::shared_ptr<const CacheClass> cls);
  virtual ~CacheHost() = default;

  CacheHost(const CacheHost &) = delete;
  auto operator=(const CacheHost &) -> CacheHost & = delete;

  auto cache_class() const -> const CacheClass & { return *class_; }

  // Dispatch through the most derived class.
  auto get(std::string_view name) const -> Expected<Value>;
  auto call(std::string_view name, const CallArgs &args) const -> Expected<Value>;
  auto set(std::string_view name, const Value &value) const -> Expected<void>;
  auto del(std::string_view name) const -> Expected<void>;

  template <typename... Args>
  auto call_with(std::string_view name, Args &&...positional) const -> Expected<Value> {
    return call(name, CallArgs{{Value(std::forward<Args>(positional))...}, {}});
  }

  auto slots() const -> CacheSlots & { return slots_; }

private:
  std::shared_ptr<const CacheClass> class_;
  mutable CacheSlots slots_;
};

class CacheClass {
public:
  using PropertyBody = std::function<Expected<Value>(const CacheHost &)>;
  using MethodBody = std::function<Expected<Value>(const CacheHost &, const BoundArguments &)>;

  struct Member {
    std::string name;
    MemberKind kind = MemberKind::Field;
    PropertyBody property;
    std::shared_ptr<const Signature> signature;
    MethodBody method;
    Value field;
    std::optional<std::size_t> slot;
  };

  auto name() const -> const std::string & { return name_; }
  auto base() const -> const std::shared_ptr<const CacheClass> & { return base_; }
  auto slot_count() const -> std::size_t { return slot_count_; }
  auto members() const -> const std::vector<Member> & { return members_; }
  auto is_subclass_of(const CacheClass &other) const -> bool;

  /// Member visible from this class: own members first, then public members of
  /// the bases. Null when absent.
  auto resolve(std::string_view name) const -> const Member *;
  auto is_cached(std::string_view name) const -> bool;

  /// Resolves `name` starting at this class, so a derived override can reach the
  /// base implementation with `base()->get(host, name)`. `host` must be an
  /// instance of this class or of a subclass.
  auto get(const CacheHost &host, std::string_view name) const -> Expected<Value>;
  auto call(const CacheHost &host, std::string_view name, const CallArgs &args) const
      -> Expected<Value>;
  auto set(const CacheHost &host, std::string_view name, const Value &value) const -> Expected<void>;
  auto del(const CacheHost &host, std::string_view name) const -> Expected<void>;

private:
  friend class CacheClassBuilder;

  CacheClass() = default;

  auto missing(std::string_view name) const -> Error;
  /// Usage error unless `host` is an instance of this class or a subclass.
  auto check_host(const CacheHost &host) const -> Expected<void>;

  std::string name_;
  std::shared_ptr<const CacheClass> base_;
  std::vector<Member> members_;
  std::size_t slot_count_ = 0;
};

class CacheClassBuilder {
public:
  explicit CacheClassBuilder(std::string name) : name_(std::move(name)) {}

  auto extends(std::shared_ptr<const CacheClass> base) -> CacheClassBuilder & {
    base_ = std::move(base);
    return *this;
  }

  /// `fn(const Self &)` returns a Value, something convertible to one, or an
  /// Expected of either.
  template <typename Self = CacheHost, typename Fn>
    requires std::derived_from<Self, CacheHost>
  auto property(std::string name, Fn fn) -> CacheClassBuilder & {
    auto body = [fn = std::move(fn), attr = name](const CacheHost &host) -> Expected<Value> {
      const auto *self = as_self<Self>(host, attr);
      if (self == nullptr) {
        return tl::unexpected(wrong_host(attr));
      }
      return detail::to_result(std::invoke(fn, *self));
    };
    return add(CacheClass::Member{std::move(name), MemberKind::Property, std::move(body), nullptr, {}, {}, {}});
  }

  /// Method with an explicit signature; `fn(const Self &, args...)` takes one
  /// argument per parameter or a single `const BoundArguments &`.
  template <typename Self = CacheHost, detail::TypedCallable Fn>
    requires std::derived_from<Self, CacheHost>
  auto method(std::string name, Signature signature, Fn fn) -> CacheClassBuilder & {
    if (auto arity = detail::check_arity<1, Fn>(signature); !arity) {
      return fail(std::move(arity.error()));
    }
    auto body = [fn = std::move(fn), attr = name](const CacheHost &host,
                                                  const BoundArguments &bound) mutable -> Expected<Value> {
      const auto *self = as_self<Self>(host, attr);
      if (self == nullptr) {
        return tl::unexpected(wrong_host(attr));
      }
      return detail::invoke_typed<1>(fn, bound, *self);
    };
    return add(CacheClass::Member{std::move(name), MemberKind::Method, {},
                                  std::make_shared<const Signature>(std::move(signature)), std::move(body),
                                  {}, {}});
  }

  /// Method whose signature is introspected from the C++ parameter types after
  /// the leading `const Self &`.
  template <typename Self = CacheHost, detail::TypedCallable Fn>
    requires std::derived_from<Self, CacheHost>
  auto method(std::string name, const std::vector<std::string> &names, Fn fn) -> CacheClassBuilder & {
    auto signature = detail::introspect_signature<1, Fn>(names);
    if (!signature) {
      return fail(std::move(signature.error()));
    }
    return method<Self>(std::move(name), std::move(*signature), std::move(fn));
  }

  auto field(std::string name, Value value) -> CacheClassBuilder & {
    return add(CacheClass::Member{std::move(name), MemberKind::Field, {}, nullptr, {}, std::move(value), {}});
  }

  /// Attributes of this class to memoize per instance.
  auto cache(std::vector<std::string> names) -> CacheClassBuilder & {
    for (auto &name : names) {
      cached_.push_back(std::move(name));
    }
    return *this;
  }

  [[nodiscard]] auto build() && -> Expected<std::shared_ptr<const CacheClass>>;

private:
  template <typename Self>
  static auto as_self(const CacheHost &host, std::string_view) -> const Self * {
    if constexpr (std::is_same_v<Self, CacheHost>) {
      return &host;
    } else {
      return dynamic_cast<const Self *>(&host);
    }
  }

  static auto wrong_host(std::string_view attr) -> Error;

  auto add(CacheClass::Member member) -> CacheClassBuilder & {
    members_.push_back(std::move(member));
    return *this;
  }

  auto fail(Error error) -> CacheClassBuilder & {
    if (!error_) {
      error_ = std::move(error);
    }
    return *this;
  }

  std::string name_;
  std::shared_ptr<const CacheClass> base_;
  std::vector<CacheClass::Member> members_;
  std::vector<std::string> cached_;
  std::optional<Error> error_;
};

}  // namespace mk::core
