#include "verdict/kind.hpp"

namespace verdict {

namespace {

constexpr std::array<std::string_view, kind_count> kind_names{
  "Ok",
  "Created",
  "NoContent",
  "Accepted",
  "Error",
  "Critical",
  "Unavailable",
  "Invalid",
  "Unprocessable",
  "Forbidden",
  "Unauthorized",
  "Conflict",
  "NotFound",
  "FailedDependency",
};

} // namespace

auto to_string(kind k) noexcept -> std::string_view {
  if (!is_defined_kind(k)) return "Unknown";
  return kind_names[static_cast<std::size_t>(k)];
}

auto kind_from_string(std::string_view name) noexcept -> std::optional<kind> {
  for (std::size_t i = 0; i < kind_names.size(); ++i) {
    if (kind_names[i] == name) return static_cast<kind>(i);
  }
  return std::nullopt;
}

} // namespace verdict
