/**
 * Order validation example using verdict
 *
 * This example demonstrates:
 * - Returning result<T> instead of throwing
 * - Pointing validation errors at fields with typed JSON pointers
 * - Turning a failure into an RFC 7807 problem report
 */

#include <verdict/json_pointer.hpp>
#include <verdict/result.hpp>
#include <verdict/serialization.hpp>
#include <verdict/web/problem_report.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

struct order_line {
    std::string sku;
    int quantity{};
};

struct order {
    std::string customer_id;
    std::vector<order_line> lines;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(order_line, sku, quantity)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(order, customer_id, lines)

constexpr auto customer_id = verdict::property(&order::customer_id, "CustomerId");
constexpr auto lines = verdict::property(&order::lines, "Lines", "items");
constexpr auto sku = verdict::property(&order_line::sku, "Sku");
constexpr auto quantity = verdict::property(&order_line::quantity, "Quantity");

const verdict::pointer_options camel{verdict::naming_policy::camel_case};

verdict::result<order> validate(const order& o) {
    std::vector<verdict::validation_error> errors;

    if (o.customer_id.empty()) {
        errors.emplace_back("customer id is required",
                            verdict::json_pointer(verdict::pointer_to<order>().field(customer_id), camel));
    }
    if (o.lines.empty()) {
        errors.emplace_back("an order needs at least one line",
                            verdict::json_pointer(verdict::pointer_to<order>().field(lines), camel));
    }
    for (std::size_t i = 0; i < o.lines.size(); ++i) {
        auto line = verdict::pointer_to<order>().field(lines).at(static_cast<std::int64_t>(i));
        if (o.lines[i].sku.empty()) {
            errors.emplace_back("sku is required", verdict::json_pointer(line.field(sku), camel));
        }
        if (o.lines[i].quantity <= 0) {
            errors.emplace_back("quantity must be positive", verdict::json_pointer(line.field(quantity), camel),
                                verdict::validation_severity::error, "ORD-QTY");
        }
    }

    if (!errors.empty()) return verdict::fail("The order is not valid.", std::move(errors));
    return verdict::succeed(o, verdict::kind::created);
}

} // namespace

int main() {
    try {
        order good{"c-17", {{"A-1", 2}, {"B-9", 1}}};
        order bad{"", {{"A-1", 0}, {"", 3}}};

        for (const order* o : {&good, &bad}) {
            auto r = validate(*o);
            std::cout << nlohmann::json(r).dump(2) << std::endl;

            if (const auto* f = r.if_failure()) {
                auto report = verdict::web::as_problem_report(*f, {.instance = "/orders"});
                std::cout << nlohmann::json(report).dump(2) << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
