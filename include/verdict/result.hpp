#pragma once

/**
 * \file result.hpp
 * \brief Success/failure outcome values.
 *
 * result<T> is a closed sum of success<T> and failure; no third alternative
 * can be constructed. Both variants are immutable: with_* members return a
 * modified copy and never touch the receiver.
 *
 * Invariants:
 * - success<T>::kind() is always in the success range of verdict::kind.
 * - failure::kind() is always in the failure range.
 * Breaking either is a caller defect and throws std::out_of_range at the
 * point of construction or copy-with-change.
 *
 * A failure is data, not a fault: it is returned, never thrown.
 */

#include <concepts>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "verdict/kind.hpp"
#include "verdict/validation_error.hpp"

namespace verdict {

namespace detail {

[[noreturn]] void throw_non_success_kind();
[[noreturn]] void throw_non_failure_kind();

inline auto checked_success_kind(kind k) -> kind {
  if (!is_success_kind(k)) throw_non_success_kind();
  return k;
}

inline auto checked_failure_kind(kind k) -> kind {
  if (!is_failure_kind(k)) throw_non_failure_kind();
  return k;
}

} // namespace detail

template <typename T = void>
class result;

/** \brief Successful outcome carrying a value of type T. */
template <typename T = void>
class success {
public:
  static constexpr bool is_success = true;
  using value_type = T;

  explicit success(T value, std::optional<std::string> message = std::nullopt,
                   verdict::kind k = verdict::kind::ok)
      : value_(std::move(value)),
        message_(std::move(message)),
        kind_(detail::checked_success_kind(k)) {}

  auto value() const& noexcept -> const T& { return value_; }
  auto value() && noexcept -> T&& { return std::move(value_); }
  auto message() const noexcept -> const std::optional<std::string>& { return message_; }
  auto kind() const noexcept -> verdict::kind { return kind_; }

  auto with_kind(verdict::kind k) const -> success {
    success copy = *this;
    copy.kind_ = detail::checked_success_kind(k);
    return copy;
  }

  auto with_message(std::optional<std::string> message) const -> success {
    success copy = *this;
    copy.message_ = std::move(message);
    return copy;
  }

  friend bool operator==(const success&, const success&) = default;

private:
  T value_;
  std::optional<std::string> message_;
  verdict::kind kind_;
};

/** \brief Successful outcome without a payload, optionally with a message. */
template <>
class success<void> {
public:
  static constexpr bool is_success = true;
  using value_type = void;

  explicit success(std::optional<std::string> message = std::nullopt,
                   verdict::kind k = verdict::kind::ok)
      : message_(std::move(message)), kind_(detail::checked_success_kind(k)) {}

  auto message() const noexcept -> const std::optional<std::string>& { return message_; }
  auto kind() const noexcept -> verdict::kind { return kind_; }

  auto with_kind(verdict::kind k) const -> success {
    success copy = *this;
    copy.kind_ = detail::checked_success_kind(k);
    return copy;
  }

  auto with_message(std::optional<std::string> message) const -> success {
    success copy = *this;
    copy.message_ = std::move(message);
    return copy;
  }

  friend bool operator==(const success&, const success&) = default;

private:
  std::optional<std::string> message_;
  verdict::kind kind_;
};

/**
 * \brief Failed outcome.
 *
 * title is a short, stable summary of the problem type ("You do not have
 * enough credit."); detail explains this occurrence ("Your current balance is
 * 30, but that costs 50."). A failure built from validation errors has kind
 * invalid.
 */
class failure {
public:
  static constexpr bool is_success = false;

  failure() = default;
  explicit failure(std::string title, std::optional<std::string> detail = std::nullopt,
                   verdict::kind k = verdict::kind::error);

  auto title() const noexcept -> const std::string& { return title_; }
  auto detail() const noexcept -> const std::optional<std::string>& { return detail_; }
  auto trace_id() const noexcept -> const std::optional<std::string>& { return trace_id_; }
  auto kind() const noexcept -> verdict::kind { return kind_; }
  auto validation_errors() const noexcept -> const std::vector<validation_error>& { return validation_errors_; }

  /**
   * \brief Plain-string view of the errors, computed on each call.
   *
   * The explicitly supplied errors when there are any; otherwise the detail of
   * every validation error, in order; otherwise empty.
   */
  auto errors() const -> std::vector<std::string>;

  /** \brief Only the plain-string errors that were supplied explicitly. */
  auto explicit_errors() const noexcept -> const std::vector<std::string>& { return errors_; }

  auto with_kind(verdict::kind k) const -> failure;
  auto with_title(std::string title) const -> failure;
  auto with_detail(std::optional<std::string> detail) const -> failure;
  auto with_errors(std::vector<std::string> errors) const -> failure;
  auto with_validation_errors(std::vector<validation_error> errors) const -> failure;
  auto with_trace_id(std::optional<std::string> trace_id) const -> failure;

  /** \brief The same failure as a result<T>; lossless for every T. */
  template <typename T>
  auto into() const& -> result<T>;
  template <typename T>
  auto into() && -> result<T>;

  friend bool operator==(const failure&, const failure&) = default;

private:
  std::string title_;
  std::optional<std::string> detail_;
  std::vector<std::string> errors_;
  std::vector<validation_error> validation_errors_;
  std::optional<std::string> trace_id_;
  verdict::kind kind_{verdict::kind::error};
};

/** \brief Helper for building exhaustive visitors out of lambdas. */
template <typename... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

/**
 * \brief Either a success<T> or a failure.
 *
 * visit() dispatches over both alternatives and does not compile unless the
 * visitor handles each of them.
 */
template <typename T>
class result {
public:
  using value_type = T;
  using success_type = success<T>;

  result(success_type s) : v_(std::move(s)) {}
  result(failure f) : v_(std::move(f)) {}

  bool is_success() const noexcept { return std::holds_alternative<success_type>(v_); }
  bool is_failure() const noexcept { return std::holds_alternative<failure>(v_); }

  auto if_success() const noexcept -> const success_type* { return std::get_if<success_type>(&v_); }
  auto if_failure() const noexcept -> const failure* { return std::get_if<failure>(&v_); }

  /** \throws std::bad_variant_access when this holds a failure */
  auto success_value() const& -> const success_type& { return std::get<success_type>(v_); }
  auto success_value() && -> success_type&& { return std::get<success_type>(std::move(v_)); }

  /** \throws std::bad_variant_access when this holds a success */
  auto failure_value() const& -> const failure& { return std::get<failure>(v_); }
  auto failure_value() && -> failure&& { return std::get<failure>(std::move(v_)); }

  auto kind() const noexcept -> verdict::kind {
    return std::visit([](const auto& alt) { return alt.kind(); }, v_);
  }

  template <typename F>
  decltype(auto) visit(F&& f) const& {
    return std::visit(std::forward<F>(f), v_);
  }

  template <typename F>
  decltype(auto) visit(F&& f) && {
    return std::visit(std::forward<F>(f), std::move(v_));
  }

  auto as_variant() const noexcept -> const std::variant<success_type, failure>& { return v_; }

  friend bool operator==(const result&, const result&) = default;

private:
  std::variant<success_type, failure> v_;
};

template <typename T>
auto failure::into() const& -> result<T> {
  return result<T>(*this);
}

template <typename T>
auto failure::into() && -> result<T> {
  return result<T>(std::move(*this));
}

// Factories --------------------------------------------------------------

inline auto succeed(kind k = kind::ok) -> success<> {
  return success<>(std::nullopt, k);
}

inline auto succeed_with_message(std::string message, kind k = kind::ok) -> success<> {
  return success<>(std::move(message), k);
}

template <typename T>
auto succeed(T&& value, kind k = kind::ok) -> success<std::decay_t<T>> {
  return success<std::decay_t<T>>(std::forward<T>(value), std::nullopt, k);
}

/** \brief Titled failure with one plain error. */
auto fail(std::string title, std::string error, kind k = kind::error) -> failure;

/** \brief Untitled failure with one plain error. */
auto fail(std::string error) -> failure;

/** \brief Untitled failure with the errors stored verbatim. */
auto fail(std::vector<std::string> errors) -> failure;

/** \brief Untitled failure from a brace list, e.g. fail({"a", "b"}). */
auto fail(std::initializer_list<std::string> errors) -> failure;

// The validation-error overloads always produce kind::invalid. Use
// failure::with_kind to pick another failure kind afterwards.

auto fail(std::vector<validation_error> errors) -> failure;
auto fail(std::string title, std::vector<validation_error> errors) -> failure;
auto fail(std::string title, validation_error error) -> failure;

template <typename... More>
  requires (std::same_as<std::remove_cvref_t<More>, validation_error> && ...)
auto fail(validation_error first, More&&... more) -> failure {
  std::vector<validation_error> errors;
  errors.reserve(1 + sizeof...(More));
  errors.push_back(std::move(first));
  (errors.push_back(std::forward<More>(more)), ...);
  return fail(std::move(errors));
}

} // namespace verdict
