#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace mseq::core {

// Backend-neutral storage failure. SQLite and Redis errors are mapped onto it
// at the backend boundary.

enum class StorageError {
  kNotFound,
  kConflict,
  kUnavailable,
};

// Value or error. value() and error() require the matching has_value() state.
// Alternatives are addressed by index so T and E may be the same type.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace mseq::core
