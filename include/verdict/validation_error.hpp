#pragma once

/**
 * \file validation_error.hpp
 * \brief Field-level validation problem carried by a failure.
 *
 * A validation_error is an immutable value. It is created where the problem
 * is detected and copied around freely afterwards; "changing" one produces a
 * new value through the with_* helpers.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace verdict {

/** \brief Severity flags; several may be combined on one error. */
enum class validation_severity : std::uint16_t {
  none = 0,
  error = 1u << 0,
  critical = 1u << 1,
  warning = 1u << 2,
  info = 1u << 3,
};

constexpr auto operator|(validation_severity a, validation_severity b) noexcept -> validation_severity {
  return static_cast<validation_severity>(static_cast<std::uint16_t>(a) | static_cast<std::uint16_t>(b));
}

constexpr auto operator&(validation_severity a, validation_severity b) noexcept -> validation_severity {
  return static_cast<validation_severity>(static_cast<std::uint16_t>(a) & static_cast<std::uint16_t>(b));
}

constexpr auto operator^(validation_severity a, validation_severity b) noexcept -> validation_severity {
  return static_cast<validation_severity>(static_cast<std::uint16_t>(a) ^ static_cast<std::uint16_t>(b));
}

constexpr auto operator~(validation_severity a) noexcept -> validation_severity {
  constexpr std::uint16_t all = 0x0F;
  return static_cast<validation_severity>(~static_cast<std::uint16_t>(a) & all);
}

constexpr auto operator|=(validation_severity& a, validation_severity b) noexcept -> validation_severity& {
  return a = a | b;
}

/** \brief True when every bit of `flag` is set in `set`. */
constexpr bool has_flag(validation_severity set, validation_severity flag) noexcept {
  return flag != validation_severity::none && (set & flag) == flag;
}

/** \brief "Error|Warning" style rendering; "None" for the empty set. */
auto to_string(validation_severity s) -> std::string;

/** \brief One problem with one field of the validated input. */
class validation_error {
public:
  /**
   * \param detail what is wrong (also known as message)
   * \param pointer JSON pointer to the offending field, see json_pointer.hpp
   * \param severity flag set, defaults to error
   * \param code domain-specific identifier
   */
  explicit validation_error(std::string detail,
                            std::optional<std::string> pointer = std::nullopt,
                            std::optional<validation_severity> severity = validation_severity::error,
                            std::optional<std::string> code = std::nullopt);

  auto detail() const noexcept -> const std::string& { return detail_; }
  auto pointer() const noexcept -> const std::optional<std::string>& { return pointer_; }
  auto severity() const noexcept -> const std::optional<validation_severity>& { return severity_; }
  auto code() const noexcept -> const std::optional<std::string>& { return code_; }

  auto with_pointer(std::optional<std::string> pointer) const -> validation_error;
  auto with_severity(std::optional<validation_severity> severity) const -> validation_error;
  auto with_code(std::optional<std::string> code) const -> validation_error;

  friend bool operator==(const validation_error&, const validation_error&) = default;

private:
  std::string detail_;
  std::optional<std::string> pointer_;
  std::optional<validation_severity> severity_;
  std::optional<std::string> code_;
};

} // namespace verdict
