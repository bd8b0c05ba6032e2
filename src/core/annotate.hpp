#pragma once

#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "core/frozen_map.hpp"
#include "core/signature.hpp"
#include "core/strict.hpp"
#include "core/value.hpp"

namespace mk::core {

namespace detail {

template <typename T>
struct function_traits;

template <typename R, typename... Args>
struct function_traits<R(Args...)> {
  using result_type = R;
  using args_tuple = std::tuple<Args...>;
};

template <typename R, typename... Args>
struct function_traits<R (*)(Args...)> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...)> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...) const> : function_traits<R(Args...)> {};

template <typename T, typename = void>
struct callable_traits;

template <typename R, typename... Args>
struct callable_traits<R(Args...), void> : function_traits<R(Args...)> {};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...), void> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...), void> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const, void> : function_traits<R(Args...)> {};

template <typename T>
struct callable_traits<T, std::void_t<decltype(&T::operator())>>
    : callable_traits<decltype(&T::operator())> {};

template <typename Fn>
concept TypedCallable = requires {
  typename callable_traits<std::decay_t<Fn>>::result_type;
  typename callable_traits<std::decay_t<Fn>>::args_tuple;
};

template <typename T>
struct expected_traits {
  using value_type = T;
  static constexpr bool is_expected = false;
};

template <typename T>
struct expected_traits<Expected<T>> {
  using value_type = T;
  static constexpr bool is_expected = true;
};

template <typename T>
inline constexpr bool is_expected_v = expected_traits<std::remove_cvref_t<T>>::is_expected;

template <std::size_t Skip, typename Tuple>
struct tuple_drop;

template <typename Tuple>
struct tuple_drop<0, Tuple> {
  using type = Tuple;
};

template <std::size_t Skip, typename T, typename... Rest>
  requires(Skip > 0)
struct tuple_drop<Skip, std::tuple<T, Rest...>> : tuple_drop<Skip - 1, std::tuple<Rest...>> {};

/// Arguments of `Fn` that come from bound call values, after `Skip` leading ones.
template <typename Fn, std::size_t Skip>
using value_args_t =
    typename tuple_drop<Skip, typename callable_traits<std::decay_t<Fn>>::args_tuple>::type;

template <typename Tuple>
inline constexpr bool takes_bound_v = false;

template <typename T>
inline constexpr bool takes_bound_v<std::tuple<T>> =
    std::is_same_v<std::remove_cvref_t<T>, BoundArguments>;

inline auto kind_mismatch(std::string_view name, std::string_view expected, const Value &value)
    -> Error {
  return make_error(ErrorCode::Validation,
                    std::format("argument '{}' expects {}, got {}", name, expected, describe(value)));
}

/// How a C++ parameter type is read from a bound Value and which annotation it
/// implies when the signature is introspected.
template <typename T>
struct ArgTraits;

template <>
struct ArgTraits<Value> {
  static auto annotation() -> std::optional<Coercer> { return std::nullopt; }
  static auto load(const Value &value, std::string_view) -> Expected<Value> { return value; }
};

template <typename T>
struct ExactArg {
  static auto load(const Value &value, std::string_view name) -> Expected<T> {
    if (const auto *payload = value.get_if<T>()) {
      return *payload;
    }
    return tl::unexpected(kind_mismatch(name, kind_name(Value(T{}).kind()), value));
  }
};

template <>
struct ArgTraits<bool> : ExactArg<bool> {
  static auto annotation() -> std::optional<Coercer> { return as_bool(); }
};

template <>
struct ArgTraits<BigInt> : ExactArg<BigInt> {
  static auto annotation() -> std::optional<Coercer> { return as_int(); }
};

template <std::signed_integral I>
  requires(!std::same_as<I, bool> && !std::same_as<I, char>)
struct ArgTraits<I> {
  static auto annotation() -> std::optional<Coercer> { return as_int(); }
  static auto load(const Value &value, std::string_view name) -> Expected<I> {
    const auto *number = value.get_if<BigInt>();
    if (number == nullptr) {
      return tl::unexpected(kind_mismatch(name, "int", value));
    }
    if (!number->fits_slong_p() || number->get_si() < std::numeric_limits<I>::min() ||
        number->get_si() > std::numeric_limits<I>::max()) {
      return tl::unexpected(make_error(
          ErrorCode::Validation, std::format("argument '{}' is out of range: {}", name, number->get_str())));
    }
    return static_cast<I>(number->get_si());
  }
};

template <>
struct ArgTraits<double> : ExactArg<double> {
  static auto annotation() -> std::optional<Coercer> { return as_float(); }
};

template <>
struct ArgTraits<Complex> : ExactArg<Complex> {
  static auto annotation() -> std::optional<Coercer> { return Coercer("complex", &strict_complex); }
};

template <>
struct ArgTraits<std::string> : ExactArg<std::string> {
  static auto annotation() -> std::optional<Coercer> { return as_str(); }
};

template <>
struct ArgTraits<Bytes> : ExactArg<Bytes> {
  static auto annotation() -> std::optional<Coercer> { return Coercer("bytes", &strict_bytes); }
};

template <>
struct ArgTraits<Tuple> : ExactArg<Tuple> {
  static auto annotation() -> std::optional<Coercer> {
    return Coercer("tuple", [](const Value &value) { return tuple_of(value); });
  }
};

template <>
struct ArgTraits<FrozenMap> : ExactArg<FrozenMap> {
  static auto annotation() -> std::optional<Coercer> {
    return Coercer("frozenmap", [](const Value &value) -> Expected<Value> {
      auto map = make_frozen_map(value);
      if (!map) {
        return tl::unexpected(map.error());
      }
      return Value(std::move(*map));
    });
  }
};

template <>
struct ArgTraits<FrozenSet> : ExactArg<FrozenSet> {
  static auto annotation() -> std::optional<Coercer> { return std::nullopt; }
};

template <>
struct ArgTraits<List> : ExactArg<List> {
  static auto annotation() -> std::optional<Coercer> { return std::nullopt; }
};

template <>
struct ArgTraits<Dict> : ExactArg<Dict> {
  static auto annotation() -> std::optional<Coercer> { return std::nullopt; }
};

template <typename T>
struct ArgTraits<std::optional<T>> {
  static constexpr bool optional = true;
  static auto annotation() -> std::optional<Coercer> { return ArgTraits<T>::annotation(); }
  static auto load(const Value &value, std::string_view name) -> Expected<std::optional<T>> {
    if (value.is_none()) {
      return std::optional<T>{};
    }
    auto loaded = ArgTraits<T>::load(value, name);
    if (!loaded) {
      return tl::unexpected(loaded.error());
    }
    return std::optional<T>(std::move(*loaded));
  }
};

template <typename T>
concept OptionalArg = requires { ArgTraits<T>::optional; };

template <typename Arg>
using arg_value_t = std::remove_cvref_t<Arg>;

template <typename R>
auto to_result(R &&result) -> Expected<Value> {
  using Raw = std::remove_cvref_t<R>;
  if constexpr (is_expected_v<Raw>) {
    if (!result) {
      return tl::unexpected(result.error());
    }
    if constexpr (std::is_void_v<typename expected_traits<Raw>::value_type>) {
      return Value(None);
    } else {
      return Value(std::move(*result));
    }
  } else {
    return Value(std::forward<R>(result));
  }
}

template <typename Tuple, typename Fn, std::size_t... I, typename... Lead>
auto invoke_loaded(Fn &fn, const BoundArguments &bound, std::index_sequence<I...>, Lead &&...lead)
    -> Expected<Value> {
  const auto &params = bound.signature().parameters();
  std::tuple<Expected<arg_value_t<std::tuple_element_t<I, Tuple>>>...> loaded{
      ArgTraits<arg_value_t<std::tuple_element_t<I, Tuple>>>::load(bound.value(I), params[I].name)...};
  std::optional<Error> failure;
  auto check = [&](const auto &item) {
    if (!failure && !item) {
      failure = item.error();
    }
  };
  (check(std::get<I>(loaded)), ...);
  if (failure) {
    return tl::unexpected(std::move(*failure));
  }
  using R = typename callable_traits<std::decay_t<Fn>>::result_type;
  if constexpr (std::is_void_v<R>) {
    std::invoke(fn, std::forward<Lead>(lead)..., std::move(*std::get<I>(loaded))...);
    return Value(None);
  } else {
    return to_result(std::invoke(fn, std::forward<Lead>(lead)..., std::move(*std::get<I>(loaded))...));
  }
}

/// Calls `fn(lead..., args...)` with each bound value read as the declared C++
/// type. A callable taking one `const BoundArguments &` receives the binding as is.
template <std::size_t Skip, typename Fn, typename... Lead>
auto invoke_typed(Fn &fn, const BoundArguments &bound, Lead &&...lead) -> Expected<Value> {
  using Args = value_args_t<Fn, Skip>;
  using R = typename callable_traits<std::decay_t<Fn>>::result_type;
  if constexpr (takes_bound_v<Args>) {
    if constexpr (std::is_void_v<R>) {
      std::invoke(fn, std::forward<Lead>(lead)..., bound);
      return Value(None);
    } else {
      return to_result(std::invoke(fn, std::forward<Lead>(lead)..., bound));
    }
  } else {
    return invoke_loaded<Args>(fn, bound, std::make_index_sequence<std::tuple_size_v<Args>>{},
                               std::forward<Lead>(lead)...);
  }
}

template <std::size_t Skip, typename Fn>
auto check_arity(const Signature &signature) -> Expected<void> {
  using Args = value_args_t<Fn, Skip>;
  if constexpr (!takes_bound_v<Args>) {
    if (std::tuple_size_v<Args> != signature.size()) {
      return tl::unexpected(make_error(
          ErrorCode::Usage, std::format("input count mismatch: signature has {} parameters, callable takes {}",
                                        signature.size(), std::tuple_size_v<Args>)));
    }
  }
  return {};
}

template <typename Tuple, std::size_t... I>
auto introspect_parameters(const std::vector<std::string> &names, std::index_sequence<I...>)
    -> std::vector<Parameter> {
  std::vector<Parameter> params;
  params.reserve(sizeof...(I));
  auto add = [&]<typename Arg>(std::size_t index) {
    using T = arg_value_t<Arg>;
    Parameter parameter{names[index], ParamKind::PositionalOrKeyword, ArgTraits<T>::annotation(),
                        std::nullopt};
    if constexpr (OptionalArg<T>) {
      parameter.default_value = Value(None);
    }
    params.push_back(std::move(parameter));
  };
  (add.template operator()<std::tuple_element_t<I, Tuple>>(I), ...);
  return params;
}

/// Signature of a typed callable: one positional-or-keyword parameter per name,
/// annotated from its C++ type; std::optional parameters default to None.
template <std::size_t Skip, typename Fn>
auto introspect_signature(const std::vector<std::string> &names) -> Expected<Signature> {
  using Args = value_args_t<Fn, Skip>;
  static_assert(!takes_bound_v<Args>, "a callable taking BoundArguments needs an explicit Signature");
  if (names.size() != std::tuple_size_v<Args>) {
    return tl::unexpected(make_error(
        ErrorCode::Usage, std::format("input count mismatch: {} names for {} parameters", names.size(),
                                      std::tuple_size_v<Args>)));
  }
  return Signature::create(
      introspect_parameters<Args>(names, std::make_index_sequence<std::tuple_size_v<Args>>{}));
}

}  // namespace detail

/// A callable whose arguments are bound, defaulted and coerced through a
/// Signature before the body runs.
class AnnotatedFunction {
public:
  using Body = std::function<Expected<Value>(const BoundArguments &)>;

  AnnotatedFunction(Signature signature, Body body)
      : signature_(std::make_shared<const Signature>(std::move(signature))), body_(std::move(body)) {}

  auto signature() const -> const Signature & { return *signature_; }

  /// The binding refers to this function's signature and must not outlive it.
  auto normalize(const CallArgs &call) const -> Expected<BoundArguments> {
    return signature_->normalize(call);
  }

  auto invoke(const BoundArguments &bound) const -> Expected<Value> { return body_(bound); }

  auto operator()(const CallArgs &call) const -> Expected<Value> {
    auto bound = normalize(call);
    if (!bound) {
      return tl::unexpected(bound.error());
    }
    return invoke(*bound);
  }

  template <typename... Args>
  auto call(Args &&...positional) const -> Expected<Value> {
    return (*this)(CallArgs{{Value(std::forward<Args>(positional))...}, {}});
  }

private:
  std::shared_ptr<const Signature> signature_;
  Body body_;
};

/// Uses `signature` verbatim. The callable takes one C++ argument per parameter
/// or a single `const BoundArguments &`.
template <detail::TypedCallable Fn>
auto apply_annotations(Signature signature, Fn fn) -> Expected<AnnotatedFunction> {
  if (auto arity = detail::check_arity<0, Fn>(signature); !arity) {
    return tl::unexpected(arity.error());
  }
  return AnnotatedFunction(std::move(signature), [fn = std::move(fn)](const BoundArguments &bound) mutable {
    return detail::invoke_typed<0>(fn, bound);
  });
}

/// Derives the signature from the callable's parameter types; `names` gives the
/// parameter names in order.
template <detail::TypedCallable Fn>
auto apply_annotations(const std::vector<std::string> &names, Fn fn) -> Expected<AnnotatedFunction> {
  auto signature = detail::introspect_signature<0, Fn>(names);
  if (!signature) {
    return tl::unexpected(signature.error());
  }
  return apply_annotations(std::move(*signature), std::move(fn));
}

}  // namespace mk::core
