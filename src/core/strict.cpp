#include "core/strict.hpp"

#include <charconv>
#include <cmath>
#include <format>

#include "core/frozen_map.hpp"

namespace mk::core {
namespace {

auto reject(std::string_view what, const Value &value) -> Error {
  return make_error(ErrorCode::Validation, std::format("{}: cannot accept {}", what, describe(value)));
}

auto trim(std::string_view text) -> std::string_view {
  const auto first = text.find_first_not_of(" \t\n\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\n\r");
  return text.substr(first, last - first + 1);
}

auto bigint_to_double(const BigInt &number, std::string_view what, const Value &value)
    -> Expected<Value> {
  const double converted = number.get_d();
  if (!std::isfinite(converted)) {
    return tl::unexpected(make_error(ErrorCode::Validation,
                                     std::format("{}: {} is too large for a float", what, describe(value))));
  }
  return Value(converted);
}

auto sequence_items(const Value &value) -> const std::vector<Value> * {
  if (const auto *tuple = value.get_if<Tuple>()) {
    return &tuple->items();
  }
  if (const auto *list = value.get_if<List>()) {
    return &list->items();
  }
  if (const auto *set = value.get_if<FrozenSet>()) {
    return &set->items();
  }
  return nullptr;
}

auto truthy(const Value &value) -> bool {
  return std::visit(
      [](const auto &payload) -> bool {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, NoneType>) {
          return false;
        } else if constexpr (std::is_same_v<T, bool>) {
          return payload;
        } else if constexpr (std::is_same_v<T, BigInt>) {
          return sgn(payload) != 0;
        } else if constexpr (std::is_same_v<T, double>) {
          return payload != 0.0;
        } else if constexpr (std::is_same_v<T, Complex>) {
          return payload != Complex{};
        } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Bytes> ||
                             std::is_same_v<T, Tuple> || std::is_same_v<T, FrozenSet> ||
                             std::is_same_v<T, FrozenMap> || std::is_same_v<T, List> ||
                             std::is_same_v<T, Dict>) {
          return payload.size() != 0;
        } else {
          return true;
        }
      },
      value.storage());
}

}  // namespace

auto Coercer::operator()(const Value &value) const -> Expected<Value> {
  if (!fn_) {
    return tl::unexpected(make_error(ErrorCode::Usage, "coercer has no conversion bound"));
  }
  return fn_(value);
}

auto strict_int(const Value &value) -> Expected<Value> {
  if (value.is<BigInt>()) {
    return value;
  }
  if (const auto *flag = value.get_if<bool>()) {
    return Value(BigInt(*flag ? 1 : 0));
  }
  return tl::unexpected(reject("strictint", value));
}

auto strict_float(const Value &value) -> Expected<Value> {
  if (value.is<double>()) {
    return value;
  }
  if (const auto *number = value.get_if<BigInt>()) {
    return bigint_to_double(*number, "strictfloat", value);
  }
  if (const auto *flag = value.get_if<bool>()) {
    return Value(*flag ? 1.0 : 0.0);
  }
  return tl::unexpected(reject("strictfloat", value));
}

auto strict_complex(const Value &value) -> Expected<Value> {
  if (value.is<Complex>()) {
    return value;
  }
  auto real = strict_float(value);
  if (!real) {
    return tl::unexpected(reject("strictcomplex", value));
  }
  return Value(Complex(real->as<double>(), 0.0));
}

auto strict_str(const Value &value) -> Expected<Value> {
  if (value.is<std::string>()) {
    return value;
  }
  return tl::unexpected(reject("strictstr", value));
}

auto strict_bool(const Value &value) -> Expected<Value> {
  if (value.is<bool>()) {
    return value;
  }
  return tl::unexpected(reject("strictbool", value));
}

auto strict_bytes(const Value &value) -> Expected<Value> {
  if (value.is<Bytes>()) {
    return value;
  }
  return tl::unexpected(reject("strictbytes", value));
}

auto to_int(const Value &value) -> Expected<Value> {
  if (auto exact = strict_int(value)) {
    return exact;
  }
  if (const auto *number = value.get_if<double>()) {
    if (!std::isfinite(*number) || std::trunc(*number) != *number) {
      return tl::unexpected(reject("int", value));
    }
    return Value(BigInt(*number));
  }
  if (const auto *text = value.get_if<std::string>()) {
    auto digits = std::string(trim(*text));
    if (!digits.empty() && digits.front() == '+') {
      digits.erase(0, 1);
    }
    BigInt parsed;
    if (digits.empty() || digits.find_first_of(" \t\n\r") != std::string::npos ||
        parsed.set_str(digits, 10) != 0) {
      return tl::unexpected(reject("int", value));
    }
    return Value(std::move(parsed));
  }
  return tl::unexpected(reject("int", value));
}

auto to_float(const Value &value) -> Expected<Value> {
  if (auto exact = strict_float(value)) {
    return exact;
  }
  if (const auto *text = value.get_if<std::string>()) {
    auto digits = trim(*text);
    if (!digits.empty() && digits.front() == '+') {
      digits.remove_prefix(1);
    }
    double parsed = 0.0;
    const auto *end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, parsed);
    if (digits.empty() || ec != std::errc{} || ptr != end) {
      return tl::unexpected(reject("float", value));
    }
    return Value(parsed);
  }
  return tl::unexpected(reject("float", value));
}

auto to_str(const Value &value) -> Expected<Value> {
  if (value.is<std::string>()) {
    return value;
  }
  return Value(value.repr());
}

auto to_bool(const Value &value) -> Expected<Value> { return Value(truthy(value)); }

auto strictint() -> Coercer { return Coercer("strictint", &strict_int); }

auto strictfloat() -> Coercer { return Coercer("strictfloat", &strict_float); }

auto strictstr() -> Coercer { return Coercer("strictstr", &strict_str); }

auto as_int() -> Coercer { return Coercer("int", &to_int); }

auto as_float() -> Coercer { return Coercer("float", &to_float); }

auto as_str() -> Coercer { return Coercer("str", &to_str); }

auto as_bool() -> Coercer { return Coercer("bool", &to_bool); }

auto StrictGeneric::operator[](Kind kind) const -> Expected<Coercer> {
  auto name = std::format("strict[{}]", kind_name(kind));
  switch (kind) {
  case Kind::Bool:
    return Coercer(std::move(name), &strict_bool);
  case Kind::Int:
    return Coercer(std::move(name), &strict_int);
  case Kind::Float:
    return Coercer(std::move(name), &strict_float);
  case Kind::Complex:
    return Coercer(std::move(name), &strict_complex);
  case Kind::Str:
    return Coercer(std::move(name), &strict_str);
  case Kind::Bytes:
    return Coercer(std::move(name), &strict_bytes);
  case Kind::Tuple:
    return Coercer(std::move(name), [](const Value &value) { return tuple_of(value); });
  case Kind::FrozenMap:
    return Coercer(std::move(name), [](const Value &value) -> Expected<Value> {
      auto map = make_frozen_map(value);
      if (!map) {
        return tl::unexpected(map.error());
      }
      return Value(std::move(*map));
    });
  default:
    return tl::unexpected(make_error(
        ErrorCode::Usage, std::format("strict: kind '{}' has no strict constructor", kind_name(kind))));
  }
}

auto StrictGeneric::operator()(const Value &) const -> Expected<Value> {
  return tl::unexpected(
      make_error(ErrorCode::Usage, "strict requires a type parameter, use strict[kind]"));
}

auto TupleGeneric::operator[](Coercer item) const -> Coercer {
  auto name = std::format("tuple[{}]", item.name());
  return Coercer(std::move(name), [item = std::move(item)](const Value &value) -> Expected<Value> {
    const auto *items = sequence_items(value);
    if (!items) {
      return tl::unexpected(reject("tuple", value));
    }
    std::vector<Value> converted;
    converted.reserve(items->size());
    for (const auto &element : *items) {
      auto result = item(element);
      if (!result) {
        return tl::unexpected(result.error());
      }
      converted.push_back(std::move(*result));
    }
    return Value(Tuple(std::move(converted)));
  });
}

auto TupleGeneric::operator()(const Value &value) const -> Expected<Value> {
  if (value.is<Tuple>()) {
    return value;
  }
  const auto *items = sequence_items(value);
  if (!items) {
    return tl::unexpected(reject("tuple", value));
  }
  return Value(Tuple(*items));
}

}  // namespace mk::core
