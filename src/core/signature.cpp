#include "core/signature.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

#include "core/canonical_hash.hpp"
#include "core/frozen_map.hpp"

namespace mk::core {
namespace {

auto usage(std::string message) -> Error { return make_error(ErrorCode::Usage, std::move(message)); }

auto is_positional(ParamKind kind) -> bool {
  return kind == ParamKind::PositionalOnly || kind == ParamKind::PositionalOrKeyword;
}

auto accepts_keyword(ParamKind kind) -> bool {
  return kind == ParamKind::PositionalOrKeyword || kind == ParamKind::KeywordOnly;
}

}  // namespace

auto param_kind_name(ParamKind kind) -> std::string_view {
  switch (kind) {
  case ParamKind::PositionalOnly:
    return "positional-only";
  case ParamKind::PositionalOrKeyword:
    return "positional-or-keyword";
  case ParamKind::VarPositional:
    return "var-positional";
  case ParamKind::KeywordOnly:
    return "keyword-only";
  case ParamKind::VarKeyword:
    return "var-keyword";
  }
  return "unknown";
}

auto BoundArguments::get(std::string_view name) const -> const Value * {
  auto index = signature_->index_of(name);
  if (!index) {
    return nullptr;
  }
  return &values_[*index];
}

auto BoundArguments::args() const -> std::vector<Value> {
  std::vector<Value> out;
  const auto &params = signature_->parameters();
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (is_positional(params[i].kind)) {
      out.push_back(values_[i]);
    } else if (params[i].kind == ParamKind::VarPositional) {
      if (const auto *tail = values_[i].get_if<Tuple>()) {
        out.insert(out.end(), tail->begin(), tail->end());
      } else {
        out.push_back(values_[i]);
      }
    }
  }
  return out;
}

auto BoundArguments::kwargs() const -> std::vector<std::pair<std::string, Value>> {
  std::vector<std::pair<std::string, Value>> out;
  const auto &params = signature_->parameters();
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (params[i].kind == ParamKind::KeywordOnly) {
      out.emplace_back(params[i].name, values_[i]);
    } else if (params[i].kind == ParamKind::VarKeyword) {
      if (const auto *tail = values_[i].get_if<Dict>()) {
        for (const auto &entry : tail->entries()) {
          out.emplace_back(entry.key.as<std::string>(), entry.value);
        }
      }
    }
  }
  return out;
}

auto BoundArguments::key() const -> Expected<Digest> {
  std::vector<Value> normalized;
  normalized.reserve(values_.size());
  for (const auto &value : values_) {
    if (value.is<Dict>()) {
      auto map = make_frozen_map(value);
      if (!map) {
        return tl::unexpected(map.error());
      }
      normalized.emplace_back(std::move(*map));
    } else {
      normalized.push_back(value);
    }
  }
  return canonical_hash(Value(Tuple(std::move(normalized))));
}

auto Signature::create(std::vector<Parameter> parameters) -> Expected<Signature> {
  std::unordered_set<std::string> names;
  bool seen_default = false;
  for (std::size_t i = 0; i < parameters.size(); ++i) {
    const auto &param = parameters[i];
    if (param.name.empty()) {
      return tl::unexpected(usage(std::format("parameter {} has no name", i)));
    }
    if (!names.insert(param.name).second) {
      return tl::unexpected(usage(std::format("duplicate parameter name '{}'", param.name)));
    }
    if (i > 0 && parameters[i - 1].kind > param.kind) {
      return tl::unexpected(usage(std::format("{} parameter '{}' cannot follow a {} parameter",
                                              param_kind_name(param.kind), param.name,
                                              param_kind_name(parameters[i - 1].kind))));
    }
    if (i > 0 && parameters[i - 1].kind == param.kind &&
        (param.kind == ParamKind::VarPositional || param.kind == ParamKind::VarKeyword)) {
      return tl::unexpected(usage(std::format("more than one {} parameter", param_kind_name(param.kind))));
    }
    if (param.default_value &&
        (param.kind == ParamKind::VarPositional || param.kind == ParamKind::VarKeyword)) {
      return tl::unexpected(usage(std::format("{} parameter '{}' cannot have a default",
                                              param_kind_name(param.kind), param.name)));
    }
    if (is_positional(param.kind)) {
      if (param.default_value) {
        seen_default = true;
      } else if (seen_default) {
        return tl::unexpected(
            usage(std::format("non-default parameter '{}' follows a default parameter", param.name)));
      }
    }
  }
  return Signature(std::move(parameters));
}

auto Signature::index_of(std::string_view name) const -> std::optional<std::size_t> {
  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    if (parameters_[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

auto Signature::has_annotations() const -> bool {
  return std::any_of(parameters_.begin(), parameters_.end(),
                     [](const Parameter &param) { return param.annotation.has_value(); });
}

auto Signature::bind(const CallArgs &call) const -> Expected<BoundArguments> {
  std::vector<std::optional<Value>> slots(parameters_.size());
  std::optional<std::size_t> var_positional;
  std::optional<std::size_t> var_keyword;
  std::size_t next_positional = 0;

  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    const auto kind = parameters_[i].kind;
    if (kind == ParamKind::VarPositional) {
      var_positional = i;
    } else if (kind == ParamKind::VarKeyword) {
      var_keyword = i;
    } else if (is_positional(kind) && next_positional < call.positional.size()) {
      slots[i] = call.positional[next_positional++];
    }
  }

  if (next_positional < call.positional.size()) {
    if (!var_positional) {
      return tl::unexpected(usage(std::format("takes {} positional arguments but {} were given",
                                              next_positional, call.positional.size())));
    }
    slots[*var_positional] = Value(Tuple(std::vector<Value>(
        call.positional.begin() + static_cast<std::ptrdiff_t>(next_positional), call.positional.end())));
  } else if (var_positional) {
    slots[*var_positional] = Value(Tuple());
  }

  Dict extra;
  for (const auto &[name, value] : call.keywords) {
    auto index = index_of(name);
    if (index && accepts_keyword(parameters_[*index].kind)) {
      if (slots[*index]) {
        return tl::unexpected(usage(std::format("multiple values for argument '{}'", name)));
      }
      slots[*index] = value;
      continue;
    }
    if (!var_keyword) {
      return tl::unexpected(usage(std::format("unexpected keyword argument '{}'", name)));
    }
    if (extra.find(Value(name))) {
      return tl::unexpected(usage(std::format("multiple values for keyword argument '{}'", name)));
    }
    extra.insert_or_assign(Value(name), value);
  }
  if (var_keyword) {
    slots[*var_keyword] = Value(std::move(extra));
  }

  std::vector<Value> values;
  values.reserve(slots.size());
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (slots[i]) {
      values.push_back(std::move(*slots[i]));
    } else if (parameters_[i].default_value) {
      values.push_back(*parameters_[i].default_value);
    } else {
      return tl::unexpected(usage(std::format("missing required argument '{}'", parameters_[i].name)));
    }
  }
  return BoundArguments(*this, std::move(values));
}

auto Signature::apply_annotations(BoundArguments &bound) const -> Expected<void> {
  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    const auto &param = parameters_[i];
    if (!param.annotation) {
      continue;
    }
    if (param.default_value && bound.value(i).is_none()) {
      continue;
    }
    auto coerced = (*param.annotation)(bound.value(i));
    if (!coerced) {
      return tl::unexpected(make_error(ErrorCode::Validation,
                                       std::format("argument '{}': {}", param.name, coerced.error().message)));
    }
    bound.replace(i, std::move(*coerced));
  }
  return {};
}

auto Signature::normalize(const CallArgs &call) const -> Expected<BoundArguments> {
  auto bound = bind(call);
  if (!bound) {
    return tl::unexpected(bound.error());
  }
  auto applied = apply_annotations(*bound);
  if (!applied) {
    return tl::unexpected(applied.error());
  }
  return bound;
}

}  // namespace mk::core
