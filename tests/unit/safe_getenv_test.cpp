#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <optional>
#include <string>
#include "verdict/core/platform_utils.hpp"

using verdict::core::env_flag;
using verdict::core::env_or;
using verdict::core::safe_getenv;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "VERDICT_TEST_SAFE_GETENV_UNSET";
    set_env_var(key, nullptr);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "VERDICT_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    set_env_var(key, nullptr);
}

TEST_CASE("env_flag treats unset, empty and leading zero as off", "[platform][env]") {
    const char* key = "VERDICT_TEST_ENV_FLAG";
    set_env_var(key, nullptr);
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "0");
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "1");
    REQUIRE(env_flag(key));
    set_env_var(key, "yes");
    REQUIRE(env_flag(key));
    set_env_var(key, nullptr);
}

TEST_CASE("env_or falls back when unset", "[platform][env]") {
    const char* key = "VERDICT_TEST_ENV_OR";
    set_env_var(key, nullptr);
    REQUIRE(env_or(key, "fallback") == "fallback");
    set_env_var(key, "configured");
    REQUIRE(env_or(key, "fallback") == "configured");
    set_env_var(key, nullptr);
}
