#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used instead of exceptions
 *
 * Example usage:
 * @code
 * Result<int> parse(const std::string& text) {
 *     if (text.empty()) {
 *         return Result<int>::error("empty input");
 *     }
 *     return Result<int>::ok(42);
 * }
 *
 * auto result = parse(input);
 * if (result.isError()) {
 *     PLANWRIGHT_LOG_ERROR(result.error());
 * }
 * @endcode
 */

#include <string>
#include <utility>
#include <variant>

namespace Planwright {

template <typename T, typename E = std::string> class Result {
public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

  [[nodiscard]] bool isOk() const { return m_data.index() == 0; }
  [[nodiscard]] bool isError() const { return m_data.index() == 1; }

  [[nodiscard]] T& value() & { return std::get<0>(m_data); }
  [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

  [[nodiscard]] const E& error() const { return std::get<1>(m_data); }

  [[nodiscard]] T valueOr(T fallback) const {
    return isOk() ? std::get<0>(m_data) : std::move(fallback);
  }

  explicit operator bool() const { return isOk(); }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : m_data(tag, std::forward<U>(payload)) {}

  std::variant<T, E> m_data;
};

template <typename E> class Result<void, E> {
public:
  static Result ok() { return Result(); }

  static Result error(E err) {
    Result result;
    result.m_error = std::move(err);
    result.m_ok = false;
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const E& error() const { return m_error; }

  explicit operator bool() const { return m_ok; }

private:
  Result() = default;

  E m_error{};
  bool m_ok = true;
};

} // namespace Planwright
