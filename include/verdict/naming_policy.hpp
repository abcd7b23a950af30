#pragma once

/** \file naming_policy.hpp
 *  \brief Property naming policies applied when a field has no explicit JSON name.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace verdict {

enum class naming_policy : std::uint8_t {
  none,              /**< declared name verbatim */
  camel_case,        /**< "NestedValue" -> "nestedValue" */
  snake_case_lower,  /**< "NestedValue" -> "nested_value" */
  snake_case_upper,  /**< "NestedValue" -> "NESTED_VALUE" */
  kebab_case_lower,  /**< "NestedValue" -> "nested-value" */
  kebab_case_upper,  /**< "NestedValue" -> "NESTED-VALUE" */
};

/** \brief Serialized form of a declared member name under `policy`. ASCII only. */
auto convert_name(naming_policy policy, std::string_view name) -> std::string;

auto to_string(naming_policy policy) noexcept -> std::string_view;

} // namespace verdict
