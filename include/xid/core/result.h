#pragma once

#include <string_view>
#include <utility>
#include <variant>

namespace xid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

enum class IdError {
  kInvalidId,  // wrong length, character outside [0-9a-v], or non-canonical padding
};

// to_string returns the message reported for an IdError.
[[nodiscard]] inline std::string_view to_string(IdError error) {
  switch (error) {
    case IdError::kInvalidId:
      return "xid: invalid ID";
  }
  return "xid: unknown error";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace xid::core
