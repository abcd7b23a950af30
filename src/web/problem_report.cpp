#include "verdict/web/problem_report.hpp"

#include <iostream>

#include "verdict/core/platform_utils.hpp"

namespace verdict::web {

auto to_http_status(kind k) -> int {
  switch (k) {
    case kind::ok: return 200;
    case kind::created: return 201;
    case kind::no_content: return 204;
    case kind::accepted: return 202;
    case kind::error: return 500;
    case kind::critical: return 500;
    case kind::unavailable: return 503;
    case kind::invalid: return 400;
    case kind::unprocessable: return 422;
    case kind::forbidden: return 403;
    case kind::unauthorized: return 401;
    case kind::conflict: return 409;
    case kind::not_found: return 404;
    case kind::failed_dependency: return 424;
  }
  throw std::out_of_range("kind has no HTTP status: " + std::to_string(static_cast<unsigned>(k)));
}

auto problem_type_base() -> std::string {
  return core::env_or("VERDICT_PROBLEM_TYPE_BASE", std::string(default_problem_type_base));
}

auto as_problem_report(const failure& f, const problem_report_options& options) -> problem_report {
  if (!options.extensions.is_object()) {
    throw std::invalid_argument("problem report extensions must be a JSON object");
  }

  const int kind_status = to_http_status(f.kind());
  problem_report report;
  report.title = options.title ? *options.title : f.title();
  if (options.detail) {
    report.detail = options.detail;
  } else if (f.detail()) {
    report.detail = f.detail();
  } else if (auto errors = f.errors(); !errors.empty()) {
    report.detail = errors.front();
  }
  report.status = options.status ? *options.status : kind_status;
  report.type = options.type ? *options.type : problem_type_base() + "/" + std::to_string(kind_status);
  report.instance = options.instance;
  report.extensions = options.extensions;

  if (!f.validation_errors().empty()) {
    if (report.extensions.contains("errors")) {
      throw std::invalid_argument("problem report extensions already contain \"errors\"");
    }
    auto errors = nlohmann::json::array();
    for (const auto& ve : f.validation_errors()) {
      nlohmann::json entry;
      entry["pointer"] = ve.pointer() ? nlohmann::json(*ve.pointer()) : nlohmann::json(nullptr);
      entry["detail"] = ve.detail();
      errors.push_back(std::move(entry));
    }
    report.extensions["errors"] = std::move(errors);
  }

  if (core::env_flag("VERDICT_PROBLEM_DEBUG")) {
    std::cerr << "[verdict][problem] kind=" << to_string(f.kind()) << " status=" << *report.status
              << " validation_errors=" << f.validation_errors().size() << std::endl;
  }
  return report;
}

void to_json(nlohmann::json& j, const problem_report& report) {
  j = nlohmann::json::object();
  for (const auto& item : report.extensions.items()) j[item.key()] = item.value();
  if (report.type) j["type"] = *report.type;
  if (report.title) j["title"] = *report.title;
  if (report.status) j["status"] = *report.status;
  if (report.detail) j["detail"] = *report.detail;
  if (report.instance) j["instance"] = *report.instance;
}

} // namespace verdict::web
