#pragma once

#include <functional>
#include <string>
#include <utility>

#include "core/error.hpp"
#include "core/value.hpp"

namespace mk::core {

/// A named value conversion. The name shows up in diagnostics and tells
/// differently-parametrized coercers apart.
class Coercer {
public:
  using Fn = std::function<Expected<Value>(const Value &)>;

  Coercer() = default;
  Coercer(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

  auto operator()(const Value &value) const -> Expected<Value>;

  auto name() const -> const std::string & { return name_; }
  explicit operator bool() const { return static_cast<bool>(fn_); }

private:
  std::string name_;
  Fn fn_;
};

// Strict constructors: accept only values of a compatible kind, never parse or
// truncate.
auto strict_int(const Value &value) -> Expected<Value>;
auto strict_float(const Value &value) -> Expected<Value>;
auto strict_complex(const Value &value) -> Expected<Value>;
auto strict_str(const Value &value) -> Expected<Value>;
auto strict_bool(const Value &value) -> Expected<Value>;
auto strict_bytes(const Value &value) -> Expected<Value>;

// Lenient conversions, the C++ counterpart of annotating a parameter with a type
// constructor.
auto to_int(const Value &value) -> Expected<Value>;
auto to_float(const Value &value) -> Expected<Value>;
auto to_str(const Value &value) -> Expected<Value>;
auto to_bool(const Value &value) -> Expected<Value>;

auto strictint() -> Coercer;
auto strictfloat() -> Coercer;
auto strictstr() -> Coercer;

auto as_int() -> Coercer;
auto as_float() -> Coercer;
auto as_str() -> Coercer;
auto as_bool() -> Coercer;

/// `strict[kind]` yields the strict constructor of that kind. Calling the
/// unparametrized generic is a usage error.
struct StrictGeneric {
  auto operator[](Kind kind) const -> Expected<Coercer>;
  auto operator()(const Value &value) const -> Expected<Value>;
};

inline constexpr StrictGeneric strict{};

/// `tuple_of[item]` builds a Tuple applying `item` to every element in order;
/// unparametrized it converts any sequence to a Tuple without validation.
struct TupleGeneric {
  auto operator[](Coercer item) const -> Coercer;
  auto operator()(const Value &value) const -> Expected<Value>;
};

inline constexpr TupleGeneric tuple_of{};

}  // namespace mk::core
