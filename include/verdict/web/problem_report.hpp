#pragma once

/**
 * \file problem_report.hpp
 * \brief RFC 7807 problem report built from a failure.
 *
 * Configuration: the documentation link base used for the default `type` is
 * read from VERDICT_PROBLEM_TYPE_BASE on each call, falling back to
 * default_problem_type_base.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "verdict/kind.hpp"
#include "verdict/result.hpp"

namespace verdict::web {

inline constexpr std::string_view default_problem_type_base =
    "https://developer.mozilla.org/en-US/docs/Web/HTTP/Reference/Status";

/** \brief HTTP status code for a kind (one-to-one table). */
auto to_http_status(kind k) -> int;

/** \brief Documentation link base currently in effect. */
auto problem_type_base() -> std::string;

/** \brief Transport-ready problem description. */
struct problem_report {
  std::optional<std::string> type;
  std::optional<std::string> title;
  std::optional<int> status;
  std::optional<std::string> detail;
  std::optional<std::string> instance;
  nlohmann::json extensions = nlohmann::json::object(); /**< flattened into the JSON object */
};

/** \brief Caller overrides; unset members fall back to values derived from the failure. */
struct problem_report_options {
  std::optional<std::string> detail;
  std::optional<std::string> instance;
  std::optional<int> status;
  std::optional<std::string> title;
  std::optional<std::string> type;
  nlohmann::json extensions = nlohmann::json::object();
};

/**
 * \brief Build a problem report from a failure.
 *
 * Validation errors are listed under the "errors" extension as
 * {"pointer", "detail"} objects.
 * \throws std::invalid_argument if options.extensions is not an object, or
 *         already holds "errors" while validation errors are present
 */
auto as_problem_report(const failure& f, const problem_report_options& options = {}) -> problem_report;

/**
 * \brief Overload for results.
 * \throws std::invalid_argument if `r` holds a success
 */
template <typename T>
auto as_problem_report(const result<T>& r, const problem_report_options& options = {}) -> problem_report {
  const auto* f = r.if_failure();
  if (f == nullptr) throw std::invalid_argument("result must hold a failure to become a problem report");
  return as_problem_report(*f, options);
}

void to_json(nlohmann::json& j, const problem_report& report);

} // namespace verdict::web
