/**
 * @file terminal_value.cpp
 * @brief Implementation of the Gordon growth terminal value
 */

#include "model/terminal_value.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <sstream>

namespace valuation
{
    namespace model
    {

        bool TerminalValueCalculator::is_valid(double discount_rate, double terminal_growth_rate)
        {
            return std::isfinite(discount_rate) &&
                   std::isfinite(terminal_growth_rate) &&
                   terminal_growth_rate > -1.0 &&
                   discount_rate > terminal_growth_rate;
        }

        void TerminalValueCalculator::require_valid(double discount_rate,
                                                    double terminal_growth_rate,
                                                    const std::string &context)
        {
            if (!is_valid(discount_rate, terminal_growth_rate))
            {
                std::ostringstream oss;
                oss << context << ": discount rate (" << discount_rate
                    << ") must exceed terminal growth rate (" << terminal_growth_rate
                    << ") and growth must exceed -100% for the Gordon growth model";
                throw DomainError(oss.str());
            }
        }

        double TerminalValueCalculator::calculate(double final_cash_flow,
                                                  double discount_rate,
                                                  double terminal_growth_rate)
        {
            require_valid(discount_rate, terminal_growth_rate);

            const double terminal_cash_flow = final_cash_flow * (1.0 + terminal_growth_rate);
            return terminal_cash_flow / (discount_rate - terminal_growth_rate);
        }

    } // namespace model
} // namespace valuation
