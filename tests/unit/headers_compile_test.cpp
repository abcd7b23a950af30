#include <verdict/error.hpp>
#include <verdict/json_pointer.hpp>
#include <verdict/kind.hpp>
#include <verdict/naming_policy.hpp>
#include <verdict/result.hpp>
#include <verdict/serialization.hpp>
#include <verdict/validation_error.hpp>
#include <verdict/web/problem_report.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  verdict::pointer_options p{};
  REQUIRE(p.property_naming == verdict::naming_policy::none);
  verdict::web::problem_report_options o{};
  REQUIRE(o.extensions.is_object());
}
