/**
 * @file cost_of_capital.cpp
 * @brief Implementation of the WACC calculator
 */

#include "model/cost_of_capital.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace valuation
{
    namespace model
    {

        CostOfCapitalCalculator::CostOfCapitalCalculator(double debt_spread)
            : debt_spread_(debt_spread)
        {
            if (!std::isfinite(debt_spread) || debt_spread < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'debt_spread', got: " +
                    std::to_string(debt_spread));
            }
        }

        double CostOfCapitalCalculator::cost_of_equity(double risk_free_rate, double beta, double market_risk_premium)
        {
            return risk_free_rate + beta * market_risk_premium;
        }

        CostOfCapital CostOfCapitalCalculator::calculate(const FinancialInputBundle &bundle) const
        {
            CostOfCapital result;

            result.cost_of_equity = cost_of_equity(
                bundle.risk_free_rate, bundle.beta, bundle.market_risk_premium);
            result.cost_of_debt = bundle.risk_free_rate + debt_spread_;
            result.after_tax_cost_of_debt = result.cost_of_debt * (1.0 - bundle.effective_tax_rate);

            const double total_capital = bundle.market_cap + bundle.total_debt;

            // No capital structure to weight: fall back to the cost of equity
            if (total_capital == 0.0)
            {
                result.equity_weight = 1.0;
                result.debt_weight = 0.0;
                result.wacc = result.cost_of_equity;
                return result;
            }

            result.equity_weight = bundle.market_cap / total_capital;
            result.debt_weight = 1.0 - result.equity_weight;
            result.wacc = result.equity_weight * result.cost_of_equity +
                          result.debt_weight * result.after_tax_cost_of_debt;

            return result;
        }

        double CostOfCapitalCalculator::calculate_wacc(const FinancialInputBundle &bundle) const
        {
            return calculate(bundle).wacc;
        }

    } // namespace model
} // namespace valuation
