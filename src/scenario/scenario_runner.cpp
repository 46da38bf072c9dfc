/**
 * @file scenario_runner.cpp
 * @brief Implementation of the single-scenario DCF pipeline
 */

#include "scenario/scenario_runner.hpp"
#include "model/present_value.hpp"
#include "model/terminal_value.hpp"

namespace valuation
{
    namespace scenario
    {

        ScenarioRunner::ScenarioRunner()
            : revenue_projector_(),
              cash_flow_projector_()
        {
        }

        ScenarioRunner::ScenarioRunner(const model::RevenueProjector &revenue_projector,
                                       const model::CashFlowProjector &cash_flow_projector)
            : revenue_projector_(revenue_projector),
              cash_flow_projector_(cash_flow_projector)
        {
        }

        double ScenarioRunner::value_per_share(double enterprise_value, const FinancialInputBundle &bundle)
        {
            const double equity_value = enterprise_value - bundle.total_debt + bundle.cash_and_equivalents;
            return equity_value / bundle.shares_outstanding;
        }

        double ScenarioRunner::upside_percentage(double value_per_share, double current_price)
        {
            return (value_per_share - current_price) / current_price * 100.0;
        }

        ScenarioResult ScenarioRunner::run(const FinancialInputBundle &bundle,
                                           const ScenarioAssumptions &assumptions) const
        {
            assumptions.validate();

            // Checked up front so the error names the scenario
            model::TerminalValueCalculator::require_valid(
                assumptions.discount_rate,
                assumptions.terminal_growth_rate,
                "Scenario '" + assumptions.scenario_name + "'");

            ScenarioResult result;
            result.scenario_name = assumptions.scenario_name;
            result.assumptions = assumptions;
            result.discount_rate = assumptions.discount_rate;
            result.terminal_growth_rate = assumptions.terminal_growth_rate;

            // 1. Revenue path
            result.projected_revenues = revenue_projector_.project(bundle.revenue_history, assumptions);

            // 2. Free cash flow path
            result.fcf_margin = cash_flow_projector_.historical_fcf_margin(bundle);
            result.projected_cash_flows = model::CashFlowProjector::project(
                result.projected_revenues,
                result.fcf_margin,
                assumptions.margin_adjustment_factor);

            // 3. Terminal value and discounting
            model::DiscountedValuation discounted = model::PresentValueDiscounter::value(
                result.projected_cash_flows,
                assumptions.discount_rate,
                assumptions.terminal_growth_rate);

            result.terminal_value = discounted.terminal_value;
            result.present_values = discounted.present_values;
            result.total_enterprise_value = discounted.enterprise_value;

            // 4. Equity bridge
            result.equity_value = result.total_enterprise_value - bundle.total_debt + bundle.cash_and_equivalents;
            result.intrinsic_value_per_share = value_per_share(result.total_enterprise_value, bundle);
            result.upside_downside_percentage = upside_percentage(
                result.intrinsic_value_per_share, bundle.current_price);

            return result;
        }

    } // namespace scenario
} // namespace valuation
