/**
 * @file scenario_result.hpp
 * @brief Output of a single-scenario DCF valuation
 */

#ifndef VALUATION_SCENARIO_SCENARIO_RESULT_HPP
#define VALUATION_SCENARIO_SCENARIO_RESULT_HPP

#include "scenario/scenario_assumptions.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace valuation
{
    namespace scenario
    {

        /**
         * @struct ScenarioResult
         * @brief Self-contained valuation for one named scenario
         *
         * Values are unrounded; rounding happens only in print_summary().
         */
        struct ScenarioResult
        {
            std::string scenario_name;               ///< Report key
            double intrinsic_value_per_share = 0.0;  ///< Equity value / shares outstanding
            double total_enterprise_value = 0.0;     ///< Sum of present values
            double equity_value = 0.0;               ///< EV - debt + cash
            double terminal_value = 0.0;             ///< Undiscounted Gordon terminal value
            double fcf_margin = 0.0;                 ///< Historical FCF margin before adjustment
            Eigen::VectorXd projected_revenues;      ///< Length = horizon
            Eigen::VectorXd projected_cash_flows;    ///< Length = horizon
            Eigen::VectorXd present_values;          ///< Length = horizon + 1, last = discounted TV
            double discount_rate = 0.0;              ///< Rate used for discounting
            double terminal_growth_rate = 0.0;       ///< Perpetual growth rate
            double upside_downside_percentage = 0.0; ///< (value - price) / price * 100
            ScenarioAssumptions assumptions;         ///< Echo of the inputs

            /**
             * @brief Discounted terminal value (last entry of present_values)
             */
            double discounted_terminal_value() const;

            /**
             * @brief Share of enterprise value contributed by the terminal value
             */
            double terminal_value_share() const;

            nlohmann::json to_json() const;

            /**
             * @brief Print a rounded summary to stdout
             */
            void print_summary() const;
        };

    } // namespace scenario
} // namespace valuation

#endif // VALUATION_SCENARIO_SCENARIO_RESULT_HPP
