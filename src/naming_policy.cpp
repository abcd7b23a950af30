#include "verdict/naming_policy.hpp"

#include <cctype>

namespace verdict {

namespace {

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char to_upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

// Lower-cases the leading upper-case run. In a run followed by a lower-case
// letter the last capital starts the next word and is kept ("URLValue" -> "urlValue").
auto camel_case(std::string_view name) -> std::string {
  std::string out(name);
  if (out.empty() || !is_upper(out[0])) return out;
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (i == 1 && !is_upper(out[i])) break;
    const bool has_next = i + 1 < out.size();
    if (i > 0 && has_next && !is_upper(out[i + 1])) {
      if (out[i + 1] == ' ') out[i] = to_lower(out[i]);
      break;
    }
    out[i] = to_lower(out[i]);
  }
  return out;
}

enum class word_state { not_started, upper, lower_or_digit, space };

// Word boundaries: lower/digit -> upper, and the last capital of an acronym
// followed by a lower-case letter. Spaces collapse into one separator; any
// other punctuation is copied and restarts word detection.
auto separated(std::string_view name, char separator, bool lower) -> std::string {
  std::string out;
  out.reserve(name.size() + name.size() / 2);
  auto state = word_state::not_started;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (is_upper(c)) {
      switch (state) {
        case word_state::not_started:
          break;
        case word_state::lower_or_digit:
        case word_state::space:
          out += separator;
          break;
        case word_state::upper:
          if (i + 1 < name.size() && is_lower(name[i + 1])) out += separator;
          break;
      }
      out += lower ? to_lower(c) : c;
      state = word_state::upper;
    } else if (is_lower(c) || is_digit(c)) {
      if (state == word_state::space) out += separator;
      out += lower ? c : to_upper(c);
      state = word_state::lower_or_digit;
    } else if (c == ' ') {
      if (state != word_state::not_started) state = word_state::space;
    } else {
      out += c;
      state = word_state::not_started;
    }
  }
  return out;
}

} // namespace

auto convert_name(naming_policy policy, std::string_view name) -> std::string {
  switch (policy) {
    case naming_policy::none: return std::string(name);
    case naming_policy::camel_case: return camel_case(name);
    case naming_policy::snake_case_lower: return separated(name, '_', true);
    case naming_policy::snake_case_upper: return separated(name, '_', false);
    case naming_policy::kebab_case_lower: return separated(name, '-', true);
    case naming_policy::kebab_case_upper: return separated(name, '-', false);
  }
  return std::string(name);
}

auto to_string(naming_policy policy) noexcept -> std::string_view {
  switch (policy) {
    case naming_policy::none: return "none";
    case naming_policy::camel_case: return "camel_case";
    case naming_policy::snake_case_lower: return "snake_case_lower";
    case naming_policy::snake_case_upper: return "snake_case_upper";
    case naming_policy::kebab_case_lower: return "kebab_case_lower";
    case naming_policy::kebab_case_upper: return "kebab_case_upper";
  }
  return "unknown";
}

} // namespace verdict
