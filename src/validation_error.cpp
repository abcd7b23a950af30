#include "verdict/validation_error.hpp"

#include <array>
#include <utility>

namespace verdict {

auto to_string(validation_severity s) -> std::string {
  static constexpr std::array<std::pair<validation_severity, std::string_view>, 4> names{{
    {validation_severity::error, "Error"},
    {validation_severity::critical, "Critical"},
    {validation_severity::warning, "Warning"},
    {validation_severity::info, "Info"},
  }};
  std::string out;
  for (const auto& [flag, name] : names) {
    if (!has_flag(s, flag)) continue;
    if (!out.empty()) out += '|';
    out += name;
  }
  return out.empty() ? std::string("None") : out;
}

validation_error::validation_error(std::string detail,
                                   std::optional<std::string> pointer,
                                   std::optional<validation_severity> severity,
                                   std::optional<std::string> code)
    : detail_(std::move(detail)),
      pointer_(std::move(pointer)),
      severity_(severity),
      code_(std::move(code)) {}

auto validation_error::with_pointer(std::optional<std::string> pointer) const -> validation_error {
  validation_error copy = *this;
  copy.pointer_ = std::move(pointer);
  return copy;
}

auto validation_error::with_severity(std::optional<validation_severity> severity) const -> validation_error {
  validation_error copy = *this;
  copy.severity_ = severity;
  return copy;
}

auto validation_error::with_code(std::optional<std::string> code) const -> validation_error {
  validation_error copy = *this;
  copy.code_ = std::move(code);
  return copy;
}

} // namespace verdict
