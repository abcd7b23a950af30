#include "verdict/json_pointer.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "verdict/core/platform_utils.hpp"

namespace verdict {

namespace {

auto pointer_debug() -> bool {
  return core::env_flag("VERDICT_POINTER_DEBUG");
}

auto literal_source(const constant& c) -> std::string {
  if (std::holds_alternative<std::int64_t>(c.value)) return std::to_string(std::get<std::int64_t>(c.value));
  if (std::holds_alternative<std::string>(c.value)) return "\"" + std::get<std::string>(c.value) + "\"";
  return "null";
}

// Text of an index literal; nullopt for the null literal.
auto literal_text(const constant& c) -> std::optional<std::string> {
  if (std::holds_alternative<std::int64_t>(c.value)) return std::to_string(std::get<std::int64_t>(c.value));
  if (std::holds_alternative<std::string>(c.value)) return std::get<std::string>(c.value);
  return std::nullopt;
}

// operator[] or at() on a sequence with exactly one non-string literal argument.
auto is_indexer(const method_call& call) -> bool {
  return call.sequence_receiver && (call.method == "operator[]" || call.method == "at") &&
         call.arguments.size() == 1 && !std::holds_alternative<std::string>(call.arguments.front().value);
}

auto serialized_name(const member_access& m, const pointer_options& options) -> std::string {
  if (m.json_name) return *m.json_name;
  return convert_name(options.property_naming, m.name);
}

// Source-like rendering of nodes [0, end).
auto render(const access_expression& expr, std::size_t end) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < end && i < expr.nodes.size(); ++i) {
    const auto& node = expr.nodes[i];
    if (std::holds_alternative<parameter>(node)) {
      out = "t";
    } else if (const auto* m = std::get_if<member_access>(&node)) {
      out += "." + m->name;
    } else if (const auto* a = std::get_if<array_index>(&node)) {
      out += "[" + literal_source(a->index) + "]";
    } else if (const auto* c = std::get_if<method_call>(&node)) {
      out += "." + c->method + "(";
      for (std::size_t k = 0; k < c->arguments.size(); ++k) {
        if (k) out += ", ";
        out += literal_source(c->arguments[k]);
      }
      out += ")";
    } else if (std::holds_alternative<convert>(node)) {
      out = "Convert(" + out + ")";
    } else if (const auto* lit = std::get_if<constant>(&node)) {
      out = literal_source(*lit);
    }
  }
  return out;
}

auto degraded(const access_expression& expr) -> std::vector<std::string> {
  if (pointer_debug()) {
    std::cerr << "[verdict][pointer] null index literal in " << to_string(expr)
              << ", falling back to " << invalid_expression_segment << std::endl;
  }
  return {std::string(invalid_expression_segment)};
}

} // namespace

auto node_kind_name(const access_node& node) noexcept -> std::string_view {
  switch (node.index()) {
    case 0: return "parameter";
    case 1: return "member_access";
    case 2: return "array_index";
    case 3: return "method_call";
    case 4: return "convert";
    case 5: return "constant";
    default: return "unknown";
  }
}

auto to_string(const access_expression& expr) -> std::string {
  return render(expr, expr.nodes.size());
}

auto resolve_segments(const access_expression& expr, const pointer_options& options)
    -> std::vector<std::string> {
  std::vector<std::string> segments; // leaf first; reversed on return

  for (std::size_t i = expr.nodes.size(); i-- > 0;) {
    const auto& node = expr.nodes[i];

    if (std::holds_alternative<parameter>(node)) {
      std::reverse(segments.begin(), segments.end());
      return segments;
    }
    if (std::holds_alternative<convert>(node)) continue;

    if (const auto* m = std::get_if<member_access>(&node)) {
      segments.push_back(serialized_name(*m, options));
      continue;
    }
    if (const auto* a = std::get_if<array_index>(&node)) {
      auto text = literal_text(a->index);
      if (!text) return degraded(expr);
      segments.push_back(std::move(*text));
      continue;
    }
    if (const auto* c = std::get_if<method_call>(&node); c && is_indexer(*c)) {
      auto text = literal_text(c->arguments.front());
      if (!text) return degraded(expr);
      segments.push_back(std::move(*text));
      continue;
    }

    std::string msg = std::string(node_kind_name(node)) + " (at " + render(expr, i + 1) + ") not supported";
    if (pointer_debug()) std::cerr << "[verdict][pointer] " << msg << std::endl;
    throw std::invalid_argument(msg);
  }

  throw std::invalid_argument("access expression has no root parameter");
}

auto uri_escape_segment(std::string_view segment) -> std::string {
  static constexpr char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(segment.size());
  for (unsigned char c : segment) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                            c == '-' || c == '.' || c == '_' || c == '~';
    if (unreserved) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

auto format_pointer(const std::vector<std::string>& segments, pointer_representation repr) -> std::string {
  switch (repr) {
    case pointer_representation::normal:
      throw std::logic_error("JSON pointer representation 'normal' is not implemented");
    case pointer_representation::json_string: {
      std::string out = "/";
      for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += segments[i];
      }
      return out;
    }
    case pointer_representation::uri_fragment: {
      std::string out = "#";
      for (const auto& s : segments) out += "/" + uri_escape_segment(s);
      return out;
    }
  }
  throw std::logic_error("unknown JSON pointer representation");
}

auto json_pointer(const access_expression& expr, const pointer_options& options) -> std::string {
  return json_pointer(expr, pointer_representation::json_string, options);
}

auto json_pointer(const access_expression& expr, pointer_representation repr, const pointer_options& options)
    -> std::string {
  if (repr == pointer_representation::normal) return format_pointer({}, repr);
  return format_pointer(resolve_segments(expr, options), repr);
}

auto json_uri_pointer(const access_expression& expr, const pointer_options& options) -> std::string {
  return json_pointer(expr, pointer_representation::uri_fragment, options);
}

} // namespace verdict
