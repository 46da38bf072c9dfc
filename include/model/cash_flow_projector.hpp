/**
 * @file cash_flow_projector.hpp
 * @brief Free cash flow projection from projected revenue
 *
 *     FCF_hist[i] = OCF[i] - capex[i] - delta_WC[i]     (last N historical years)
 *     margin      = mean(FCF_hist[i] / revenue[i])
 *     FCF_y       = revenue_y * margin * margin_adjustment_factor
 *
 * N defaults to 3. Years with non-positive revenue are excluded from the
 * margin average.
 */

#pragma once

#include "data/financial_inputs.hpp"
#include <Eigen/Dense>

namespace valuation
{
    namespace model
    {

        /**
         * @class CashFlowProjector
         * @brief Converts projected revenue into projected free cash flow
         */
        class CashFlowProjector
        {
        public:
            static constexpr int DEFAULT_LOOKBACK_YEARS = 3;

            /**
             * @brief Construct projector
             * @param lookback_years Historical years used for the FCF margin (>= 1)
             * @throws std::invalid_argument if lookback_years < 1
             */
            explicit CashFlowProjector(int lookback_years = DEFAULT_LOOKBACK_YEARS);

            /**
             * @brief Historical free cash flow over the lookback window
             * @param bundle Validated financial inputs
             * @return FCF for the last min(lookback, num_years) years, oldest first
             */
            Eigen::VectorXd historical_free_cash_flows(const FinancialInputBundle &bundle) const;

            /**
             * @brief Average historical FCF margin over the lookback window
             * @param bundle Validated financial inputs
             * @return Mean of FCF / revenue
             * @throws DomainError if no year in the window has positive revenue
             */
            double historical_fcf_margin(const FinancialInputBundle &bundle) const;

            /**
             * @brief Project free cash flow
             * @param projected_revenue Projected revenue path
             * @param fcf_margin Historical FCF margin
             * @param margin_adjustment_factor Scenario multiplier on the margin
             * @return Projected FCF, same length as projected_revenue
             */
            static Eigen::VectorXd project(const Eigen::VectorXd &projected_revenue,
                                           double fcf_margin,
                                           double margin_adjustment_factor);

            int get_lookback_years() const { return lookback_years_; }

        private:
            int lookback_years_;
        };

    } // namespace model
} // namespace valuation
