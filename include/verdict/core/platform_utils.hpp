#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace verdict::core {

// Cross-platform getenv wrapper. Returns std::nullopt when the variable is not
// set and an engaged, possibly empty, string otherwise.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
        std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Debug switches: set, non-empty and not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    const auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

// Value of `name`, or `fallback` when unset or empty.
inline std::string env_or(const char* name, const std::string& fallback) {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return fallback;
    return *v;
}

} // namespace verdict::core
