#include "core/value_json.hpp"

#include <bit>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <type_traits>

#include "core/frozen_map.hpp"

namespace mk::core {
namespace {

auto invalid(std::string message) -> Error { return make_error(ErrorCode::Validation, std::move(message)); }

auto hex_encode(std::string_view data) -> std::string {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0Fu]);
  }
  return out;
}

auto hex_decode(std::string_view text) -> Expected<std::string> {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };
  if (text.size() % 2 != 0) {
    return tl::unexpected(invalid("bytes: odd number of hex digits"));
  }
  std::string out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const int hi = nibble(text[i]);
    const int lo = nibble(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return tl::unexpected(invalid("bytes: invalid hex digit"));
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

auto kind_from_name(std::string_view name) -> Expected<Kind> {
  for (std::size_t i = 0; i < kKindCount; ++i) {
    const auto kind = static_cast<Kind>(i);
    if (kind_name(kind) == name) {
      return kind;
    }
  }
  return tl::unexpected(invalid(std::format("unknown kind '{}'", name)));
}

auto encode_items(const std::vector<Value> &items) -> Expected<Json> {
  Json array = Json::array();
  for (const auto &item : items) {
    auto encoded = encode_json(item);
    if (!encoded) {
      return tl::unexpected(encoded.error());
    }
    array.push_back(std::move(*encoded));
  }
  return array;
}

auto encode_entries(const std::vector<MapEntry> &entries) -> Expected<Json> {
  Json array = Json::array();
  for (const auto &entry : entries) {
    auto key = encode_json(entry.key);
    if (!key) {
      return tl::unexpected(key.error());
    }
    auto value = encode_json(entry.value);
    if (!value) {
      return tl::unexpected(value.error());
    }
    array.push_back(Json::array({std::move(*key), std::move(*value)}));
  }
  return array;
}

auto decode_items(const Json &json, std::string_view kind) -> Expected<std::vector<Value>> {
  if (!json.is_array()) {
    return tl::unexpected(invalid(std::format("{} payload must be an array", kind)));
  }
  std::vector<Value> items;
  items.reserve(json.size());
  for (const auto &element : json) {
    auto item = decode_json(element);
    if (!item) {
      return tl::unexpected(item.error());
    }
    items.push_back(std::move(*item));
  }
  return items;
}

auto decode_entries(const Json &json, std::string_view kind) -> Expected<std::vector<MapEntry>> {
  if (!json.is_array()) {
    return tl::unexpected(invalid(std::format("{} payload must be an array", kind)));
  }
  std::vector<MapEntry> entries;
  entries.reserve(json.size());
  for (const auto &pair : json) {
    if (!pair.is_array() || pair.size() != 2) {
      return tl::unexpected(invalid(std::format("{} entries must be [key, value] pairs", kind)));
    }
    auto key = decode_json(pair[0]);
    if (!key) {
      return tl::unexpected(key.error());
    }
    auto value = decode_json(pair[1]);
    if (!value) {
      return tl::unexpected(value.error());
    }
    entries.push_back(MapEntry{std::move(*key), std::move(*value)});
  }
  return entries;
}

// Non-finite doubles have no JSON number form; they travel as their IEEE bit
// pattern so NaN payloads survive.
auto encode_float(double number) -> Json {
  if (std::isfinite(number)) {
    return number;
  }
  return std::format("0x{:016x}", std::bit_cast<std::uint64_t>(number));
}

auto decode_float(const Json &json) -> Expected<double> {
  if (json.is_number()) {
    return json.get<double>();
  }
  if (json.is_string()) {
    const auto &text = json.get_ref<const std::string &>();
    std::uint64_t bits = 0;
    const auto *end = text.data() + text.size();
    if (text.size() == 18 && text.starts_with("0x")) {
      auto [ptr, ec] = std::from_chars(text.data() + 2, end, bits, 16);
      if (ec == std::errc{} && ptr == end) {
        return std::bit_cast<double>(bits);
      }
    }
  }
  return tl::unexpected(invalid("float payload must be a number or a 0x-prefixed bit pattern"));
}

}  // namespace

auto encode_json(const Value &value) -> Expected<Json> {
  const auto tag = std::string(kind_name(value.kind()));
  return std::visit(
      [&](const auto &payload) -> Expected<Json> {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, NoneType> || std::is_same_v<T, EllipsisType>) {
          return Json{{tag, nullptr}};
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
          return Json{{tag, payload}};
        } else if constexpr (std::is_same_v<T, double>) {
          return Json{{tag, encode_float(payload)}};
        } else if constexpr (std::is_same_v<T, BigInt>) {
          return Json{{tag, payload.get_str()}};
        } else if constexpr (std::is_same_v<T, Complex>) {
          return Json{{tag, Json::array({encode_float(payload.real()), encode_float(payload.imag())})}};
        } else if constexpr (std::is_same_v<T, Bytes>) {
          return Json{{tag, hex_encode(payload.data())}};
        } else if constexpr (std::is_same_v<T, Tuple> || std::is_same_v<T, FrozenSet> ||
                             std::is_same_v<T, List>) {
          auto items = encode_items(payload.items());
          if (!items) {
            return tl::unexpected(items.error());
          }
          return Json{{tag, std::move(*items)}};
        } else if constexpr (std::is_same_v<T, FrozenMap>) {
          auto entries = encode_entries(payload.entries().items());
          if (!entries) {
            return tl::unexpected(entries.error());
          }
          return Json{{tag, std::move(*entries)}};
        } else if constexpr (std::is_same_v<T, Dict>) {
          auto entries = encode_entries(payload.entries());
          if (!entries) {
            return tl::unexpected(entries.error());
          }
          return Json{{tag, std::move(*entries)}};
        } else if constexpr (std::is_same_v<T, TypeValue>) {
          return Json{{tag, std::string(kind_name(payload.kind))}};
        } else {
          return tl::unexpected(invalid(std::format("cannot serialize {}", value.repr())));
        }
      },
      value.storage());
}

auto decode_json(const Json &json) -> Expected<Value> {
  if (!json.is_object() || json.size() != 1) {
    return tl::unexpected(invalid("encoded value must be an object with exactly one member"));
  }
  const auto member = json.begin();
  const std::string name = member.key();
  const Json &payload = member.value();
  auto kind = kind_from_name(name);
  if (!kind) {
    return tl::unexpected(kind.error());
  }
  switch (*kind) {
  case Kind::None:
    return Value(None);
  case Kind::Ellipsis:
    return Value(Ellipsis);
  case Kind::Bool:
    if (!payload.is_boolean()) {
      return tl::unexpected(invalid("bool payload must be a boolean"));
    }
    return Value(payload.get<bool>());
  case Kind::Int: {
    BigInt number;
    if (!payload.is_string() || number.set_str(payload.get<std::string>(), 10) != 0) {
      return tl::unexpected(invalid("int payload must be a decimal string"));
    }
    return Value(std::move(number));
  }
  case Kind::Float: {
    auto number = decode_float(payload);
    if (!number) {
      return tl::unexpected(number.error());
    }
    return Value(*number);
  }
  case Kind::Complex: {
    if (!payload.is_array() || payload.size() != 2) {
      return tl::unexpected(invalid("complex payload must be [real, imag]"));
    }
    auto real = decode_float(payload[0]);
    auto imag = decode_float(payload[1]);
    if (!real || !imag) {
      return tl::unexpected(invalid("complex parts must be numbers"));
    }
    return Value(Complex(*real, *imag));
  }
  case Kind::Str:
    if (!payload.is_string()) {
      return tl::unexpected(invalid("str payload must be a string"));
    }
    return Value(payload.get<std::string>());
  case Kind::Bytes: {
    if (!payload.is_string()) {
      return tl::unexpected(invalid("bytes payload must be a hex string"));
    }
    auto data = hex_decode(payload.get<std::string>());
    if (!data) {
      return tl::unexpected(data.error());
    }
    return Value(Bytes(std::move(*data)));
  }
  case Kind::Tuple:
  case Kind::List:
  case Kind::FrozenSet: {
    auto items = decode_items(payload, name);
    if (!items) {
      return tl::unexpected(items.error());
    }
    if (*kind == Kind::Tuple) {
      return Value(Tuple(std::move(*items)));
    }
    if (*kind == Kind::List) {
      return Value(List(std::move(*items)));
    }
    auto set = FrozenSet::create(std::move(*items));
    if (!set) {
      return tl::unexpected(set.error());
    }
    return Value(std::move(*set));
  }
  case Kind::FrozenMap:
  case Kind::Dict: {
    auto entries = decode_entries(payload, name);
    if (!entries) {
      return tl::unexpected(entries.error());
    }
    if (*kind == Kind::Dict) {
      Dict dict;
      for (auto &entry : *entries) {
        dict.insert_or_assign(std::move(entry.key), std::move(entry.value));
      }
      return Value(std::move(dict));
    }
    auto map = make_frozen_map(std::move(*entries));
    if (!map) {
      return tl::unexpected(map.error());
    }
    return Value(std::move(*map));
  }
  case Kind::Type: {
    if (!payload.is_string()) {
      return tl::unexpected(invalid("type payload must be a kind name"));
    }
    auto type = kind_from_name(payload.get<std::string>());
    if (!type) {
      return tl::unexpected(type.error());
    }
    return type_of(*type);
  }
  case Kind::Custom:
    break;
  }
  return tl::unexpected(invalid(std::format("kind '{}' cannot be decoded", name)));
}

auto from_plain_json(const Json &json) -> Expected<Value> {
  switch (json.type()) {
  case Json::value_t::null:
    return Value(None);
  case Json::value_t::boolean:
    return Value(json.get<bool>());
  case Json::value_t::number_integer:
    return Value(json.get<std::int64_t>());
  case Json::value_t::number_unsigned:
    return Value(json.get<std::uint64_t>());
  case Json::value_t::number_float:
    return Value(json.get<double>());
  case Json::value_t::string:
    return Value(json.get<std::string>());
  case Json::value_t::array: {
    std::vector<Value> items;
    items.reserve(json.size());
    for (const auto &element : json) {
      auto item = from_plain_json(element);
      if (!item) {
        return tl::unexpected(item.error());
      }
      items.push_back(std::move(*item));
    }
    return Value(Tuple(std::move(items)));
  }
  case Json::value_t::object: {
    FrozenMapBuilder builder(json.size());
    for (const auto &[key, element] : json.items()) {
      auto item = from_plain_json(element);
      if (!item) {
        return tl::unexpected(item.error());
      }
      builder.insert(Value(key), std::move(*item));
    }
    auto map = std::move(builder).build();
    if (!map) {
      return tl::unexpected(map.error());
    }
    return Value(std::move(*map));
  }
  default:
    return tl::unexpected(invalid("unsupported json value"));
  }
}

auto serialize(const FrozenMap &map) -> Expected<std::string> {
  auto encoded = encode_json(Value(map));
  if (!encoded) {
    return tl::unexpected(encoded.error());
  }
  try {
    return encoded->dump(-1, ' ', false, Json::error_handler_t::strict);
  } catch (const Json::exception &ex) {
    return tl::unexpected(invalid(std::format("serialize: {}", ex.what())));
  }
}

auto restore_frozen_map(std::string_view text) -> Expected<FrozenMap> {
  auto json = Json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(invalid("restore: malformed json"));
  }
  auto value = decode_json(json);
  if (!value) {
    return tl::unexpected(value.error());
  }
  if (!value->is<FrozenMap>()) {
    return tl::unexpected(invalid(std::format("restore: expected a frozenmap, got {}", kind_name(value->kind()))));
  }
  return value->as<FrozenMap>();
}

}  // namespace mk::core
