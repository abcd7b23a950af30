#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "verdict/result.hpp"

using verdict::failure;
using verdict::kind;
using verdict::result;
using verdict::success;
using verdict::validation_error;

namespace {

struct example {
  int num{2};
  friend bool operator==(const example&, const example&) = default;
};

} // namespace

TEST_CASE("fail with a success kind throws", "[result]") {
  auto k = GENERATE(kind::ok, kind::accepted, kind::no_content, kind::created);
  REQUIRE_THROWS_MATCHES(verdict::fail("").with_kind(k), std::out_of_range,
                         Catch::Matchers::Message("Cannot set non-error status to a failure result."));
  REQUIRE_THROWS_AS(failure("title", std::nullopt, k), std::out_of_range);
  REQUIRE_THROWS_AS(verdict::fail("title", "error", k), std::out_of_range);
}

TEST_CASE("succeed with a failure kind throws", "[result]") {
  auto k = GENERATE(kind::error, kind::critical, kind::invalid, kind::failed_dependency);
  REQUIRE_THROWS_MATCHES(verdict::succeed().with_kind(k), std::out_of_range,
                         Catch::Matchers::Message("Cannot set non-success status to a success result."));
  REQUIRE_THROWS_AS(verdict::succeed(k), std::out_of_range);
  REQUIRE_THROWS_AS(verdict::succeed(example{}, k), std::out_of_range);
  REQUIRE_THROWS_AS(verdict::succeed_with_message("done", k), std::out_of_range);
}

TEST_CASE("every success kind is accepted on a success", "[result]") {
  auto k = GENERATE(kind::ok, kind::created, kind::no_content, kind::accepted);
  REQUIRE(verdict::succeed(k).kind() == k);
  REQUIRE(verdict::succeed(42, k).kind() == k);
  REQUIRE(verdict::succeed().with_kind(k).kind() == k);
}

TEST_CASE("every failure kind is accepted on a failure", "[result]") {
  for (auto k : verdict::all_kinds()) {
    if (!verdict::is_failure_kind(k)) continue;
    REQUIRE(verdict::fail("boom").with_kind(k).kind() == k);
    REQUIRE(verdict::fail("title", "error", k).kind() == k);
  }
}

TEST_CASE("with_kind does not modify the receiver", "[result]") {
  const auto f = verdict::fail("boom");
  const auto g = f.with_kind(kind::conflict);
  REQUIRE(f.kind() == kind::error);
  REQUIRE(g.kind() == kind::conflict);

  const auto s = verdict::succeed();
  REQUIRE_THROWS(s.with_kind(kind::error));
  REQUIRE(s.kind() == kind::ok);
}

TEST_CASE("validation errors project onto errors", "[result]") {
  auto f = verdict::fail(validation_error("Some error 1"), validation_error("Some error 2"));
  REQUIRE(f.errors() == std::vector<std::string>{"Some error 1", "Some error 2"});
  REQUIRE(f.explicit_errors().empty());
  REQUIRE(f.validation_errors().size() == 2);
}

TEST_CASE("explicit errors win over the projection", "[result]") {
  auto f = verdict::fail(validation_error("from validation")).with_errors({"explicit"});
  REQUIRE(f.errors() == std::vector<std::string>{"explicit"});
  REQUIRE(f.validation_errors().front().detail() == "from validation");
}

TEST_CASE("projection follows validation errors set after construction", "[result]") {
  const auto f = verdict::fail(std::vector<std::string>{});
  REQUIRE(f.errors().empty());
  const auto g = f.with_validation_errors({validation_error("late")});
  REQUIRE(g.errors() == std::vector<std::string>{"late"});
  REQUIRE(f.errors().empty());
}

TEST_CASE("validation-error failures are always invalid", "[result]") {
  REQUIRE(verdict::fail(validation_error("a")).kind() == kind::invalid);
  REQUIRE(verdict::fail(validation_error("a"), validation_error("b")).kind() == kind::invalid);
  REQUIRE(verdict::fail("Title", validation_error("a")).kind() == kind::invalid);
  REQUIRE(verdict::fail(std::vector<validation_error>{validation_error("a")}).kind() == kind::invalid);
  REQUIRE(verdict::fail("Title", std::vector<validation_error>{}).kind() == kind::invalid);

  auto titled = verdict::fail("Bad order", validation_error("qty must be positive", "/qty"));
  REQUIRE(titled.title() == "Bad order");
  REQUIRE(titled.validation_errors().front().pointer() == "/qty");
  REQUIRE(titled.with_kind(kind::unprocessable).kind() == kind::unprocessable);
}

TEST_CASE("string failures", "[result]") {
  auto single = verdict::fail("Some error");
  REQUIRE(single.title().empty());
  REQUIRE(single.kind() == kind::error);
  REQUIRE(single.errors() == std::vector<std::string>{"Some error"});

  auto many = verdict::fail(std::vector<std::string>{"Error 1", "Error 2"});
  REQUIRE(many.title().empty());
  REQUIRE(many.errors() == std::vector<std::string>{"Error 1", "Error 2"});

  auto braced = verdict::fail({"Error 1", "Error 2"});
  REQUIRE(braced.errors() == std::vector<std::string>{"Error 1", "Error 2"});
  REQUIRE(braced.kind() == kind::error);
  REQUIRE(verdict::fail({"only"}).errors() == std::vector<std::string>{"only"});

  auto titled = verdict::fail("Payment refused", "card expired", kind::forbidden);
  REQUIRE(titled.title() == "Payment refused");
  REQUIRE(titled.errors() == std::vector<std::string>{"card expired"});
  REQUIRE(titled.kind() == kind::forbidden);
  REQUIRE_FALSE(titled.detail().has_value());

  auto detailed = failure("Out of credit", "Your current balance is 30, but that costs 50.");
  REQUIRE(detailed.detail() == "Your current balance is 30, but that costs 50.");
  REQUIRE(detailed.errors().empty());
}

TEST_CASE("success and failure are discernible", "[result]") {
  result<> f = verdict::fail("Some error");
  result<> s = verdict::succeed_with_message("Some success");

  REQUIRE(f.is_failure());
  REQUIRE_FALSE(f.is_success());
  REQUIRE(s.is_success());
  REQUIRE_FALSE(s.is_failure());
  REQUIRE(f.if_success() == nullptr);
  REQUIRE(s.if_failure() == nullptr);
  REQUIRE(s.success_value().message() == "Some success");
  REQUIRE_THROWS_AS(s.failure_value(), std::bad_variant_access);
  REQUIRE_THROWS_AS(f.success_value(), std::bad_variant_access);

  STATIC_REQUIRE(success<>::is_success);
  STATIC_REQUIRE(success<example>::is_success);
  STATIC_REQUIRE_FALSE(failure::is_success);
}

TEST_CASE("success value is accessible", "[result]") {
  result<example> r = verdict::succeed(example{});
  REQUIRE(r.is_success());
  REQUIRE(r.success_value().value().num == 2);
  REQUIRE(r.kind() == kind::ok);
}

TEST_CASE("visit dispatches over both alternatives", "[result]") {
  result<example> r = verdict::succeed(example{});
  const int num = r.visit(verdict::overloaded{
      [](const success<example>& s) { return s.value().num; },
      [](const failure&) { return -1; },
  });
  REQUIRE(num == 2);

  result<example> f = verdict::fail("nope");
  const bool ok = f.visit(verdict::overloaded{
      [](const success<example>&) { return true; },
      [](const failure&) { return false; },
  });
  REQUIRE_FALSE(ok);
  REQUIRE(f.kind() == kind::error);
}

TEST_CASE("succeed deduces the payload type", "[result]") {
  auto s = verdict::succeed(example{});
  STATIC_REQUIRE(std::is_same_v<decltype(s), success<example>>);

  auto n = verdict::succeed(std::optional<int>{});
  REQUIRE_FALSE(n.value().has_value());

  result<int> one = verdict::succeed(1);
  const int content = one.visit(verdict::overloaded{
      [](const success<int>& v) { return v.value(); },
      [](const failure&) { return 0; },
  });
  REQUIRE(content == 1);
}

TEST_CASE("success carries an optional message", "[result]") {
  REQUIRE_FALSE(verdict::succeed().message().has_value());
  REQUIRE(verdict::succeed_with_message("saved", kind::created).message() == "saved");
  auto s = verdict::succeed(example{}).with_message("stored");
  REQUIRE(s.message() == "stored");
  REQUIRE(s.value().num == 2);
}

TEST_CASE("failure converts to result of any type losslessly", "[result]") {
  const auto original = failure("Test", "details here", kind::not_found)
                            .with_errors({"e1", "e2"})
                            .with_validation_errors({validation_error("v1", "/a")})
                            .with_trace_id("trace-123");

  result<example> as_example = original;
  result<int> as_int = original.into<int>();
  result<std::string> as_string = failure(original).into<std::string>();

  for (const failure* f : {as_example.if_failure(), as_int.if_failure(), as_string.if_failure()}) {
    REQUIRE(f != nullptr);
    REQUIRE(f->title() == "Test");
    REQUIRE(f->detail() == "details here");
    REQUIRE(f->errors() == original.errors());
    REQUIRE(f->explicit_errors() == original.explicit_errors());
    REQUIRE(f->validation_errors() == original.validation_errors());
    REQUIRE(f->kind() == kind::not_found);
    REQUIRE(f->trace_id() == "trace-123");
    REQUIRE(*f == original);
  }
}

TEST_CASE("default failure", "[result]") {
  result<example> r = failure().with_title("Test");
  REQUIRE(r.is_failure());
  REQUIRE(r.failure_value().title() == "Test");
  REQUIRE(r.failure_value().kind() == kind::error);
  REQUIRE(r.failure_value().errors().empty());
  REQUIRE_FALSE(r.failure_value().trace_id().has_value());
}
