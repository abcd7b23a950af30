#pragma once

/**
 * \file kind.hpp
 * \brief Outcome categories shared by success and failure values.
 *
 * The enumeration is ordered and split by first_failure_kind into a success
 * range and a failure range. Values are only ever appended so the boundary
 * stays where it is.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace verdict {

/** \brief Outcome category. Order is part of the contract. */
enum class kind : std::uint16_t {
  ok,
  created,
  no_content,
  accepted,

  error,
  critical,
  unavailable,
  invalid,
  unprocessable,
  forbidden,
  unauthorized,
  conflict,
  not_found,
  failed_dependency,
};

/** \brief First value of the failure range. */
inline constexpr kind first_failure_kind = kind::error;

/** \brief Number of defined kinds. */
inline constexpr std::size_t kind_count = static_cast<std::size_t>(kind::failed_dependency) + 1;

constexpr bool is_defined_kind(kind k) noexcept {
  return static_cast<std::size_t>(k) < kind_count;
}

constexpr bool is_success_kind(kind k) noexcept {
  return k < first_failure_kind;
}

constexpr bool is_failure_kind(kind k) noexcept {
  return k >= first_failure_kind && is_defined_kind(k);
}

/** \brief Every defined kind, in declaration order. */
constexpr auto all_kinds() noexcept -> std::array<kind, kind_count> {
  std::array<kind, kind_count> out{};
  for (std::size_t i = 0; i < kind_count; ++i) out[i] = static_cast<kind>(i);
  return out;
}

/** \brief Stable name ("Ok", "NoContent", ...); "Unknown" for undefined values. */
auto to_string(kind k) noexcept -> std::string_view;

/** \brief Inverse of to_string. Names are matched exactly. */
auto kind_from_string(std::string_view name) noexcept -> std::optional<kind>;

} // namespace verdict
