#include "verdict/result.hpp"

#include <stdexcept>

namespace verdict {

namespace detail {

void throw_non_success_kind() {
  throw std::out_of_range("Cannot set non-success status to a success result.");
}

void throw_non_failure_kind() {
  throw std::out_of_range("Cannot set non-error status to a failure result.");
}

} // namespace detail

failure::failure(std::string title, std::optional<std::string> detail, verdict::kind k)
    : title_(std::move(title)),
      detail_(std::move(detail)),
      kind_(verdict::detail::checked_failure_kind(k)) {}

auto failure::errors() const -> std::vector<std::string> {
  if (!errors_.empty()) return errors_;
  std::vector<std::string> out;
  out.reserve(validation_errors_.size());
  for (const auto& ve : validation_errors_) out.push_back(ve.detail());
  return out;
}

auto failure::with_kind(verdict::kind k) const -> failure {
  failure copy = *this;
  copy.kind_ = verdict::detail::checked_failure_kind(k);
  return copy;
}

auto failure::with_title(std::string title) const -> failure {
  failure copy = *this;
  copy.title_ = std::move(title);
  return copy;
}

auto failure::with_detail(std::optional<std::string> detail) const -> failure {
  failure copy = *this;
  copy.detail_ = std::move(detail);
  return copy;
}

auto failure::with_errors(std::vector<std::string> errors) const -> failure {
  failure copy = *this;
  copy.errors_ = std::move(errors);
  return copy;
}

auto failure::with_validation_errors(std::vector<validation_error> errors) const -> failure {
  failure copy = *this;
  copy.validation_errors_ = std::move(errors);
  return copy;
}

auto failure::with_trace_id(std::optional<std::string> trace_id) const -> failure {
  failure copy = *this;
  copy.trace_id_ = std::move(trace_id);
  return copy;
}

auto fail(std::string title, std::string error, kind k) -> failure {
  return failure(std::move(title), std::nullopt, k).with_errors({std::move(error)});
}

auto fail(std::string error) -> failure {
  return failure().with_errors({std::move(error)});
}

auto fail(std::vector<std::string> errors) -> failure {
  return failure().with_errors(std::move(errors));
}

auto fail(std::initializer_list<std::string> errors) -> failure {
  return fail(std::vector<std::string>(errors));
}

auto fail(std::vector<validation_error> errors) -> failure {
  return fail(std::string(), std::move(errors));
}

auto fail(std::string title, std::vector<validation_error> errors) -> failure {
  return failure(std::move(title), std::nullopt, kind::invalid).with_validation_errors(std::move(errors));
}

auto fail(std::string title, validation_error error) -> failure {
  std::vector<validation_error> errors;
  errors.push_back(std::move(error));
  return fail(std::move(title), std::move(errors));
}

} // namespace verdict
