// present_value.hpp
#pragma once

#include <Eigen/Dense>

namespace valuation {
namespace model {

/**
 * @struct DiscountedValuation
 * @brief Present values of a projection plus its terminal value
 *
 * present_values has horizon + 1 entries: the discounted cash flow of each
 * projection year followed by the discounted terminal value.
 */
struct DiscountedValuation {
    Eigen::VectorXd present_values;
    double terminal_value{0.0};     ///< Undiscounted terminal value
    double enterprise_value{0.0};   ///< Sum of present_values

    double discounted_terminal_value() const {
        return present_values(present_values.size() - 1);
    }
};

class PresentValueDiscounter {
public:
    /**
     * @brief Discount cash flows and a terminal value at a flat rate
     *
     * PV_i = CF_i / (1 + r)^i for i = 1..H, PV_TV = TV / (1 + r)^H.
     *
     * @throws DomainError if discount_rate <= -1 or cash_flows is empty
     */
    static Eigen::VectorXd discount(const Eigen::VectorXd& cash_flows,
                                    double terminal_value,
                                    double discount_rate);

    /**
     * @brief Terminal value (Gordon) plus discounting in one step
     * @throws DomainError if discount_rate <= terminal_growth_rate
     */
    static DiscountedValuation value(const Eigen::VectorXd& cash_flows,
                                     double discount_rate,
                                     double terminal_growth_rate);
};

} // namespace model
} // namespace valuation
