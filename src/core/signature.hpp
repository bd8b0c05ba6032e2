#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/digest.hpp"
#include "core/error.hpp"
#include "core/strict.hpp"
#include "core/value.hpp"

namespace mk::core {

/// Declaration order must follow the enumerator order.
enum class ParamKind {
  PositionalOnly,
  PositionalOrKeyword,
  VarPositional,
  KeywordOnly,
  VarKeyword,
};

auto param_kind_name(ParamKind kind) -> std::string_view;

struct Parameter {
  std::string name;
  ParamKind kind = ParamKind::PositionalOrKeyword;
  std::optional<Coercer> annotation;
  std::optional<Value> default_value;

  auto with_default(Value value) && -> Parameter {
    default_value = std::move(value);
    return std::move(*this);
  }
};

inline auto positional_only(std::string name, std::optional<Coercer> annotation = std::nullopt)
    -> Parameter {
  return Parameter{std::move(name), ParamKind::PositionalOnly, std::move(annotation), std::nullopt};
}

inline auto param(std::string name, std::optional<Coercer> annotation = std::nullopt) -> Parameter {
  return Parameter{std::move(name), ParamKind::PositionalOrKeyword, std::move(annotation),
                   std::nullopt};
}

inline auto keyword_only(std::string name, std::optional<Coercer> annotation = std::nullopt)
    -> Parameter {
  return Parameter{std::move(name), ParamKind::KeywordOnly, std::move(annotation), std::nullopt};
}

inline auto var_positional(std::string name, std::optional<Coercer> annotation = std::nullopt)
    -> Parameter {
  return Parameter{std::move(name), ParamKind::VarPositional, std::move(annotation), std::nullopt};
}

inline auto var_keyword(std::string name, std::optional<Coercer> annotation = std::nullopt)
    -> Parameter {
  return Parameter{std::move(name), ParamKind::VarKeyword, std::move(annotation), std::nullopt};
}

/// Actual arguments of one call.
struct CallArgs {
  std::vector<Value> positional;
  std::vector<std::pair<std::string, Value>> keywords;
};

class Signature;

/// One value per declared parameter, in declaration order. The var-positional
/// parameter holds a Tuple, the var-keyword parameter a Dict.
class BoundArguments {
public:
  BoundArguments(const Signature &signature, std::vector<Value> values)
      : signature_(&signature), values_(std::move(values)) {}

  auto signature() const -> const Signature & { return *signature_; }
  auto values() const -> const std::vector<Value> & { return values_; }
  auto value(std::size_t index) const -> const Value & { return values_[index]; }
  auto replace(std::size_t index, Value value) -> void { values_[index] = std::move(value); }

  /// Null when no parameter has this name.
  auto get(std::string_view name) const -> const Value *;

  /// Positional view: positional parameters followed by the var-positional items.
  auto args() const -> std::vector<Value>;
  /// Keyword view: keyword-only parameters followed by the var-keyword items.
  auto kwargs() const -> std::vector<std::pair<std::string, Value>>;

  /// Digest over the normalized arguments; the memoization key of a call.
  auto key() const -> Expected<Digest>;

private:
  const Signature *signature_;
  std::vector<Value> values_;
};

class Signature {
public:
  Signature() = default;

  /// Validates parameter order, names and defaults.
  static auto create(std::vector<Parameter> parameters) -> Expected<Signature>;

  auto parameters() const -> const std::vector<Parameter> & { return parameters_; }
  auto size() const -> std::size_t { return parameters_.size(); }
  auto index_of(std::string_view name) const -> std::optional<std::size_t>;
  auto has_annotations() const -> bool;

  /// Binds call arguments to parameters and applies declared defaults.
  auto bind(const CallArgs &call) const -> Expected<BoundArguments>;

  /// Replaces each annotated bound value with its coerced form. A None bound to
  /// a parameter with a declared default is passed through.
  auto apply_annotations(BoundArguments &bound) const -> Expected<void>;

  auto normalize(const CallArgs &call) const -> Expected<BoundArguments>;

private:
  explicit Signature(std::vector<Parameter> parameters) : parameters_(std::move(parameters)) {}

  std::vector<Parameter> parameters_;
};

}  // namespace mk::core
