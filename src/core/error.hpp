#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace mk::core {

enum class ErrorCode {
  Validation,
  IllegalMutation,
  NotFound,
  Usage,
  Unhashable,
};

struct Error {
  ErrorCode code = ErrorCode::Validation;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
  return Error{code, std::move(message)};
}

inline auto error_code_name(ErrorCode code) -> std::string_view {
  switch (code) {
  case ErrorCode::Validation:
    return "validation";
  case ErrorCode::IllegalMutation:
    return "illegal_mutation";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Usage:
    return "usage";
  case ErrorCode::Unhashable:
    return "unhashable";
  }
  return "unknown";
}

}  // namespace mk::core
