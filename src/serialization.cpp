#include "verdict/serialization.hpp"

#include <vector>

namespace verdict {

namespace {

auto optional_string(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, kind k) {
  j = std::string(to_string(k));
}

void from_json(const nlohmann::json& j, kind& k) {
  if (j.is_number_integer()) {
    const auto ordinal = j.get<std::int64_t>();
    if (ordinal < 0 || static_cast<std::size_t>(ordinal) >= kind_count) {
      throw std::out_of_range("kind ordinal out of range: " + std::to_string(ordinal));
    }
    k = static_cast<kind>(ordinal);
    return;
  }
  const auto name = j.get<std::string>();
  const auto parsed = kind_from_string(name);
  if (!parsed) throw std::out_of_range("unknown kind: " + name);
  k = *parsed;
}

void to_json(nlohmann::json& j, validation_severity s) {
  j = static_cast<std::uint16_t>(s);
}

void from_json(const nlohmann::json& j, validation_severity& s) {
  const auto bits = j.get<std::int64_t>();
  if (bits < 0 || bits > 0x0F) throw std::out_of_range("validation severity out of range: " + std::to_string(bits));
  s = static_cast<validation_severity>(bits);
}

auto validation_error_to_json(const validation_error& e) -> nlohmann::json {
  nlohmann::json j;
  j["detail"] = e.detail();
  if (e.pointer()) j["pointer"] = *e.pointer();
  if (e.severity()) j["severity"] = *e.severity();
  if (e.code()) j["code"] = *e.code();
  return j;
}

auto validation_error_from_json(const nlohmann::json& j) -> validation_error {
  std::optional<validation_severity> severity;
  if (auto it = j.find("severity"); it != j.end() && !it->is_null()) severity = it->get<validation_severity>();
  return validation_error(j.at("detail").get<std::string>(), optional_string(j, "pointer"), severity,
                          optional_string(j, "code"));
}

void to_json(nlohmann::json& j, const failure& f) {
  j = nlohmann::json::object();
  j["title"] = f.title();
  if (f.detail()) j["detail"] = *f.detail();
  j["errors"] = f.errors();
  if (!f.explicit_errors().empty()) j["errorsExplicit"] = true;
  j["validationErrors"] = f.validation_errors();
  if (f.trace_id()) j["traceId"] = *f.trace_id();
  j["kind"] = f.kind();
}

void from_json(const nlohmann::json& j, failure& f) {
  std::vector<validation_error> validation;
  if (auto it = j.find("validationErrors"); it != j.end() && !it->is_null()) {
    validation = it->get<std::vector<validation_error>>();
  }
  // Same default as the validation-error factories.
  const auto fallback = validation.empty() ? kind::error : kind::invalid;
  const auto k = j.contains("kind") ? j.at("kind").get<kind>() : fallback;
  failure out(j.at("title").get<std::string>(), optional_string(j, "detail"), k);
  out = out.with_validation_errors(std::move(validation));

  // "errors" is written as the computed view. "errorsExplicit" marks it as
  // stored errors; without the marker it is kept only when it differs from
  // what the validation errors already project to.
  if (auto it = j.find("errors"); it != j.end() && !it->is_null()) {
    auto errors = it->get<std::vector<std::string>>();
    const bool marked = j.contains("errorsExplicit") && j.at("errorsExplicit").get<bool>();
    if (marked || errors != out.errors()) out = out.with_errors(std::move(errors));
  }
  f = out.with_trace_id(optional_string(j, "traceId"));
}

namespace detail {

auto message_from_json(const nlohmann::json& j) -> std::optional<std::string> {
  return optional_string(j, "message");
}

auto success_kind_from_json(const nlohmann::json& j) -> kind {
  return j.contains("kind") ? j.at("kind").get<kind>() : kind::ok;
}

} // namespace detail

auto parse_validation_error(std::string_view text) -> std::expected<validation_error, core::error> {
  return detail::guarded_parse(text, [](const nlohmann::json& j) { return validation_error_from_json(j); });
}

auto parse_failure(std::string_view text) -> std::expected<failure, core::error> {
  return detail::guarded_parse(text, [](const nlohmann::json& j) { return j.get<failure>(); });
}

} // namespace verdict
