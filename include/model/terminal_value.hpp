/**
 * @file terminal_value.hpp
 * @brief Gordon growth terminal value
 *
 *     TV = FCF_H * (1 + g) / (r - g)
 *
 * The model is only defined for r > g. The precondition is checked before
 * the division so that r <= g surfaces as a DomainError instead of a
 * division by zero or a sign-flipped value.
 */

#pragma once

#include <string>

namespace valuation
{
    namespace model
    {

        /**
         * @class TerminalValueCalculator
         * @brief Value of all cash flows beyond the explicit projection horizon
         */
        class TerminalValueCalculator
        {
        public:
            /**
             * @brief Compute the Gordon growth terminal value
             * @param final_cash_flow Cash flow of the last projected year
             * @param discount_rate Discount rate r
             * @param terminal_growth_rate Perpetual growth rate g
             * @return Terminal value at the end of the horizon (undiscounted)
             * @throws DomainError if discount_rate <= terminal_growth_rate or terminal_growth_rate <= -1
             */
            static double calculate(double final_cash_flow,
                                    double discount_rate,
                                    double terminal_growth_rate);

            /**
             * @brief Check the Gordon precondition r > g > -1
             */
            static bool is_valid(double discount_rate, double terminal_growth_rate);

            /**
             * @brief Throw DomainError if r <= g or g <= -1
             * @param context Prefix for the error message (e.g. scenario name)
             */
            static void require_valid(double discount_rate,
                                      double terminal_growth_rate,
                                      const std::string &context = "Terminal value");
        };

    } // namespace model
} // namespace valuation
