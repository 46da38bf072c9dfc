/**
 * @file scenario_runner.hpp
 * @brief Single-scenario DCF valuation
 *
 * Pipeline for one ScenarioAssumptions:
 *
 *     revenue  = RevenueProjector::project(history, assumptions)
 *     fcf      = revenue * historical_margin * margin_adjustment_factor
 *     TV, PV   = PresentValueDiscounter::value(fcf, r, g)
 *     equity   = sum(PV) - total_debt + cash
 *     value    = equity / shares_outstanding
 *     upside   = (value - price) / price * 100
 *
 * The runner is a pure function of (bundle, assumptions): no side effects,
 * safe to run concurrently across scenarios.
 */

#pragma once

#include "data/financial_inputs.hpp"
#include "model/cash_flow_projector.hpp"
#include "model/revenue_projector.hpp"
#include "scenario/scenario_assumptions.hpp"
#include "scenario/scenario_result.hpp"

namespace valuation
{
    namespace scenario
    {

        /**
         * @class ScenarioRunner
         * @brief Runs the projection and discounting pipeline for one scenario
         *
         * Usage Example:
         * @code
         * ScenarioRunner runner;
         * ScenarioAssumptions custom;
         * custom.scenario_name = "custom";
         * custom.revenue_growth_rate = 0.06;
         * custom.discount_rate = 0.09;
         * custom.terminal_growth_rate = 0.02;
         * auto result = runner.run(bundle, custom);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ScenarioRunner
        {
        public:
            /**
             * @brief Construct runner with default projectors
             */
            ScenarioRunner();

            /**
             * @brief Construct runner with configured projectors
             */
            ScenarioRunner(const model::RevenueProjector &revenue_projector,
                           const model::CashFlowProjector &cash_flow_projector);

            /**
             * @brief Value the bundle under one scenario
             * @param bundle Validated financial inputs
             * @param assumptions Scenario assumptions with a resolved discount rate
             * @return ScenarioResult
             * @throws ValidationError if the assumptions are malformed
             * @throws DomainError if discount_rate <= terminal_growth_rate or no FCF margin can be derived
             */
            ScenarioResult run(const FinancialInputBundle &bundle,
                               const ScenarioAssumptions &assumptions) const;

            /**
             * @brief Equity value per share from an enterprise value
             */
            static double value_per_share(double enterprise_value, const FinancialInputBundle &bundle);

            /**
             * @brief Upside (+) or downside (-) versus the market price, in percent
             */
            static double upside_percentage(double value_per_share, double current_price);

            const model::RevenueProjector &revenue_projector() const { return revenue_projector_; }
            const model::CashFlowProjector &cash_flow_projector() const { return cash_flow_projector_; }

        private:
            model::RevenueProjector revenue_projector_;
            model::CashFlowProjector cash_flow_projector_;
        };

    } // namespace scenario
} // namespace valuation
