#include "model/present_value.hpp"
#include "model/terminal_value.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <sstream>

namespace valuation {
namespace model {

Eigen::VectorXd PresentValueDiscounter::discount(const Eigen::VectorXd& cash_flows,
                                                 double terminal_value,
                                                 double discount_rate) {
    if (cash_flows.size() == 0) {
        throw DomainError("Cannot discount an empty cash flow projection");
    }
    if (!std::isfinite(discount_rate) || discount_rate <= -1.0) {
        std::ostringstream ss; ss << discount_rate;
        throw DomainError("Discount rate must be finite and greater than -1, got: " + ss.str());
    }

    const Eigen::Index horizon = cash_flows.size();
    Eigen::VectorXd pv(horizon + 1);

    for (Eigen::Index i = 0; i < horizon; ++i) {
        pv(i) = cash_flows(i) / std::pow(1.0 + discount_rate, static_cast<double>(i + 1));
    }
    pv(horizon) = terminal_value / std::pow(1.0 + discount_rate, static_cast<double>(horizon));

    return pv;
}

DiscountedValuation PresentValueDiscounter::value(const Eigen::VectorXd& cash_flows,
                                                  double discount_rate,
                                                  double terminal_growth_rate) {
    if (cash_flows.size() == 0) {
        throw DomainError("Cannot value an empty cash flow projection");
    }

    DiscountedValuation out;
    out.terminal_value = TerminalValueCalculator::calculate(
        cash_flows(cash_flows.size() - 1), discount_rate, terminal_growth_rate);
    out.present_values = discount(cash_flows, out.terminal_value, discount_rate);
    out.enterprise_value = out.present_values.sum();
    return out;
}

} // namespace model
} // namespace valuation
