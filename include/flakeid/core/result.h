#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace flakeid::core {

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Success (T) or failure (E) is encoded explicitly so callers have to branch on it.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// Alternatives are selected by index, so T and E may be the same type (e.g. std::string).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

  std::variant<T, E> data_;
};

}  // namespace flakeid::core
