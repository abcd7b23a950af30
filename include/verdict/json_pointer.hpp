#pragma once

/**
 * \file json_pointer.hpp
 * \brief JSON pointers (RFC 6901) built from typed field-access paths.
 *
 * Two layers:
 * - access_expression: a value-semantic AST describing "start at the root
 *   object, read this field, index that element, ...". It can be built by
 *   hand, and may then contain shapes the resolver rejects.
 * - pointer_builder<Root, Current>: a typed front-end that only produces
 *   supported shapes. Each step is checked at compile time against the
 *   declared member types.
 *
 * Example:
 * \code
 *   constexpr auto items = verdict::property(&order::items, "Items", "lines");
 *   constexpr auto sku = verdict::property(&order_line::sku, "Sku");
 *   auto p = verdict::json_pointer(verdict::pointer_to<order>().field(items).at(2).field(sku),
 *                                  {.property_naming = verdict::naming_policy::camel_case});
 *   // p == "/lines/2/sku"
 * \endcode
 *
 * Thread-safety: all functions are pure.
 */

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "verdict/naming_policy.hpp"

namespace verdict {

/** \brief A literal in an access expression; monostate is the null literal. */
struct constant {
  std::variant<std::monostate, std::int64_t, std::string> value;
};

/** \brief The root object the expression starts from. */
struct parameter {};

/** \brief Field read; json_name is an explicit rename that beats any naming policy. */
struct member_access {
  std::string name;                     /**< declared member name */
  std::optional<std::string> json_name; /**< serialized name override */
};

/** \brief Built-in array subscript. */
struct array_index {
  constant index;
};

/** \brief Method call on the preceding node. */
struct method_call {
  std::string method;
  std::vector<constant> arguments;
  bool sequence_receiver{false}; /**< receiver is a random-access sequence */
};

/** \brief Implicit numeric widening; contributes no path segment. */
struct convert {};

using access_node = std::variant<parameter, member_access, array_index, method_call, convert, constant>;

/** \brief Access path, root first. Each node applies to the node before it. */
struct access_expression {
  std::vector<access_node> nodes;
};

/** \brief "parameter", "member_access", ... */
auto node_kind_name(const access_node& node) noexcept -> std::string_view;

/** \brief Source-like rendering, e.g. "t.Items.operator[](2).Sku". */
auto to_string(const access_expression& expr) -> std::string;

/** \brief Representations named by RFC 6901. */
enum class pointer_representation : std::uint8_t {
  normal,       /**< RFC 6901 §3, with ~0/~1 escaping; not implemented */
  json_string,  /**< "/" followed by the segments joined with "/"; the root is "/" */
  uri_fragment, /**< RFC 6901 §6; the root is "#" */
};

struct pointer_options {
  naming_policy property_naming{naming_policy::none};
};

/** \brief Sole segment produced when an index literal has no textual value. */
inline constexpr std::string_view invalid_expression_segment = "INVALID_EXPRESSION";

/**
 * \brief Root-to-leaf path segments for `expr`.
 * \throws std::invalid_argument on a node shape other than parameter, member
 *         access, array index, integer indexer call or convert, and on an
 *         expression without a root parameter.
 * A null index literal is not an error: the result is then the single
 * segment invalid_expression_segment.
 */
auto resolve_segments(const access_expression& expr, const pointer_options& options = {})
    -> std::vector<std::string>;

/**
 * \brief Join segments in the requested representation.
 * \throws std::logic_error for pointer_representation::normal
 */
auto format_pointer(const std::vector<std::string>& segments, pointer_representation repr) -> std::string;

/** \brief Percent-encodes everything outside the RFC 3986 unreserved set. */
auto uri_escape_segment(std::string_view segment) -> std::string;

auto json_pointer(const access_expression& expr, const pointer_options& options = {}) -> std::string;
auto json_pointer(const access_expression& expr, pointer_representation repr,
                  const pointer_options& options = {}) -> std::string;
auto json_uri_pointer(const access_expression& expr, const pointer_options& options = {}) -> std::string;

// Typed front-end ------------------------------------------------------------

/** \brief Declared name and optional JSON rename of one data member. */
template <typename Class, typename Member>
struct json_property {
  Member Class::*member;
  std::string_view name;
  std::string_view json_name; /**< empty: no rename */
};

template <typename Class, typename Member>
constexpr auto property(Member Class::*member, std::string_view name, std::string_view json_name = {})
    -> json_property<Class, Member> {
  return {member, name, json_name};
}

namespace detail {

template <typename C>
struct builtin_array : std::false_type {};
template <typename E, std::size_t N>
struct builtin_array<E[N]> : std::true_type {
  using element_type = E;
};
template <typename E, std::size_t N>
struct builtin_array<std::array<E, N>> : std::true_type {
  using element_type = E;
};

template <typename C>
concept array_like = builtin_array<C>::value;

template <typename C>
concept indexed_sequence = !array_like<C> && requires(const C& c, std::size_t i) {
  typename C::value_type;
  { c[i] } -> std::convertible_to<const typename C::value_type&>;
};

template <typename C>
struct element_of;
template <array_like C>
struct element_of<C> {
  using type = typename builtin_array<C>::element_type;
};
template <indexed_sequence C>
struct element_of<C> {
  using type = typename C::value_type;
};

template <typename C>
using element_t = typename element_of<C>::type;

template <typename From, typename To>
concept widening = std::is_arithmetic_v<From> && std::is_arithmetic_v<To> &&
                   !std::is_same_v<From, bool> && !std::is_same_v<To, bool> && (
  (std::is_integral_v<From> && std::is_floating_point_v<To>) ||
  (std::is_floating_point_v<From> && std::is_floating_point_v<To> && sizeof(To) >= sizeof(From)) ||
  (std::is_integral_v<From> && std::is_integral_v<To> &&
   std::is_signed_v<From> == std::is_signed_v<To> && sizeof(To) >= sizeof(From)) ||
  (std::is_integral_v<From> && std::is_integral_v<To> &&
   std::is_unsigned_v<From> && std::is_signed_v<To> && sizeof(To) > sizeof(From)));

} // namespace detail

/** \brief Typed access path from Root to a value of type Current. */
template <typename Root, typename Current = Root>
class pointer_builder {
public:
  using root_type = Root;
  using current_type = Current;

  pointer_builder() : expr_{{parameter{}}} {}
  explicit pointer_builder(access_expression expr) : expr_(std::move(expr)) {}

  template <typename Member>
  auto field(const json_property<Current, Member>& p) const -> pointer_builder<Root, Member> {
    auto expr = expr_;
    std::optional<std::string> json_name;
    if (!p.json_name.empty()) json_name = std::string(p.json_name);
    expr.nodes.emplace_back(member_access{std::string(p.name), std::move(json_name)});
    return pointer_builder<Root, Member>(std::move(expr));
  }

  /** \brief Element at a literal position of an array or random-access sequence. */
  template <typename C = Current>
    requires detail::array_like<C> || detail::indexed_sequence<C>
  auto at(std::int64_t index) const -> pointer_builder<Root, detail::element_t<C>> {
    auto expr = expr_;
    if constexpr (detail::array_like<C>) {
      expr.nodes.emplace_back(array_index{constant{index}});
    } else {
      expr.nodes.emplace_back(method_call{"operator[]", {constant{index}}, true});
    }
    return pointer_builder<Root, detail::element_t<C>>(std::move(expr));
  }

  template <typename To>
    requires detail::widening<Current, To>
  auto widen() const -> pointer_builder<Root, To> {
    auto expr = expr_;
    expr.nodes.emplace_back(convert{});
    return pointer_builder<Root, To>(std::move(expr));
  }

  auto expression() const noexcept -> const access_expression& { return expr_; }

private:
  access_expression expr_;
};

template <typename Root>
auto pointer_to() -> pointer_builder<Root> {
  return pointer_builder<Root>();
}

template <typename Root, typename Current>
auto json_pointer(const pointer_builder<Root, Current>& path, const pointer_options& options = {}) -> std::string {
  return json_pointer(path.expression(), options);
}

template <typename Root, typename Current>
auto json_pointer(const pointer_builder<Root, Current>& path, pointer_representation repr,
                  const pointer_options& options = {}) -> std::string {
  return json_pointer(path.expression(), repr, options);
}

template <typename Root, typename Current>
auto json_uri_pointer(const pointer_builder<Root, Current>& path, const pointer_options& options = {}) -> std::string {
  return json_uri_pointer(path.expression(), options);
}

} // namespace verdict
