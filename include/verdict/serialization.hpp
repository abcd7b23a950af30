#pragma once

/**
 * \file serialization.hpp
 * \brief nlohmann/json mapping of the verdict value types.
 *
 * Member names are camelCase. Absent optionals are left out of the output
 * rather than written as null. kind is written by name and read from either
 * its name or its ordinal.
 *
 * Converting with nlohmann::json directly throws on malformed input
 * (nlohmann::json::exception, or std::out_of_range for a kind/severity that
 * breaks an invariant). The parse_* helpers report the same conditions as
 * core::error values instead.
 */

#include <exception>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "verdict/error.hpp"
#include "verdict/kind.hpp"
#include "verdict/result.hpp"
#include "verdict/validation_error.hpp"

namespace verdict {

void to_json(nlohmann::json& j, kind k);
void from_json(const nlohmann::json& j, kind& k);

void to_json(nlohmann::json& j, validation_severity s);
void from_json(const nlohmann::json& j, validation_severity& s);

/**
 * \brief "errors" carries the computed errors() view; "errorsExplicit": true is
 * added when the failure holds stored errors. Without "kind", a failure with
 * validation errors reads back as kind::invalid, otherwise as kind::error.
 */
void to_json(nlohmann::json& j, const failure& f);
void from_json(const nlohmann::json& j, failure& f);

auto validation_error_to_json(const validation_error& e) -> nlohmann::json;
auto validation_error_from_json(const nlohmann::json& j) -> validation_error;

namespace detail {

auto message_from_json(const nlohmann::json& j) -> std::optional<std::string>;
auto success_kind_from_json(const nlohmann::json& j) -> kind;

template <typename F>
auto guarded_parse(std::string_view text, F&& convert)
    -> std::expected<decltype(convert(std::declval<const nlohmann::json&>())), core::error> {
  try {
    const auto j = nlohmann::json::parse(text.begin(), text.end());
    return convert(j);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(core::error{core::error_code::data_integrity, e.what(), "verdict.json"});
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(core::error{core::error_code::invalid_argument, e.what(), "verdict.json"});
  } catch (const std::out_of_range& e) {
    return std::unexpected(core::error{core::error_code::out_of_range, e.what(), "verdict.json"});
  }
}

} // namespace detail

/** \brief Parse a validation_error from JSON text. */
auto parse_validation_error(std::string_view text) -> std::expected<validation_error, core::error>;

/** \brief Parse a failure from JSON text. */
auto parse_failure(std::string_view text) -> std::expected<failure, core::error>;

/** \brief Parse a result<T>; "isSuccess" selects the alternative. */
template <typename T = void>
auto parse_result(std::string_view text) -> std::expected<result<T>, core::error> {
  return detail::guarded_parse(text, [](const nlohmann::json& j) { return j.get<result<T>>(); });
}

} // namespace verdict

namespace nlohmann {

template <>
struct adl_serializer<verdict::validation_error> {
  static void to_json(json& j, const verdict::validation_error& e) { j = verdict::validation_error_to_json(e); }
  static auto from_json(const json& j) -> verdict::validation_error { return verdict::validation_error_from_json(j); }
};

template <typename T>
struct adl_serializer<verdict::success<T>> {
  static void to_json(json& j, const verdict::success<T>& s) {
    j = json::object();
    if constexpr (!std::is_void_v<T>) j["value"] = s.value();
    if (s.message()) j["message"] = *s.message();
    j["kind"] = s.kind();
  }

  static auto from_json(const json& j) -> verdict::success<T> {
    if constexpr (std::is_void_v<T>) {
      return verdict::success<>(verdict::detail::message_from_json(j), verdict::detail::success_kind_from_json(j));
    } else {
      return verdict::success<T>(j.at("value").get<T>(), verdict::detail::message_from_json(j),
                                 verdict::detail::success_kind_from_json(j));
    }
  }
};

template <typename T>
struct adl_serializer<verdict::result<T>> {
  static void to_json(json& j, const verdict::result<T>& r) {
    r.visit([&j](const auto& alt) { j = alt; });
    j["isSuccess"] = r.is_success();
  }

  static auto from_json(const json& j) -> verdict::result<T> {
    if (j.at("isSuccess").get<bool>()) return j.get<verdict::success<T>>();
    return j.get<verdict::failure>();
  }
};

} // namespace nlohmann
