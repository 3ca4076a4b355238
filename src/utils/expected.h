/**
 * @file expected.h
 * @brief Minimal std::expected-like type for C++17
 *
 * Expected<T, E> holds either a value of type T or an error of type E.
 * Expected<void, E> holds either nothing (success) or an error.
 */

#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace hkp::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  [[nodiscard]] const char* what() const noexcept override { return "bad Expected access"; }
  [[nodiscard]] const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {

template <typename T>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !std::is_same_v<std::decay_t<U>, Expected> &&
                                        !std::is_same_v<std::decay_t<U>, Unexpected<E>>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  const T& value() const& {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  T&& value() && {
    ThrowIfError();
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }
  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }
  E&& error() && {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::move(std::get<1>(storage_));
  }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, keep the error
   */
  template <typename F>
  auto transform(F&& func) const& {
    using U = std::invoke_result_t<F, const T&>;
    if constexpr (std::is_void_v<U>) {
      if (!has_value()) {
        return Expected<void, E>(MakeUnexpected(error()));
      }
      std::forward<F>(func)(**this);
      return Expected<void, E>();
    } else {
      if (!has_value()) {
        return Expected<U, E>(MakeUnexpected(error()));
      }
      return Expected<U, E>(std::forward<F>(func)(**this));
    }
  }

  /**
   * @brief Chain an operation returning Expected<U, E>
   */
  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<Result>::value, "and_then requires a function returning Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(**this);
  }

  /**
   * @brief Recover from an error with a function returning Expected<T, E>
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  void ThrowIfError() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

/**
 * @brief Expected<void, E>: success carries no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : error_(unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }
  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }
  E&& error() && {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::move(*error_);
  }

  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<Result>::value, "and_then requires a function returning Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(*error_));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::forward<F>(func)(*error_)));
  }

 private:
  std::optional<E> error_;
};

}  // namespace hkp::utils
