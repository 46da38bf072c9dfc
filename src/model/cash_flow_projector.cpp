/**
 * @file cash_flow_projector.cpp
 * @brief Implementation of free cash flow projection
 */

#include "model/cash_flow_projector.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace valuation
{
    namespace model
    {

        CashFlowProjector::CashFlowProjector(int lookback_years)
            : lookback_years_(lookback_years)
        {
            if (lookback_years < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'lookback_years', got: " +
                    std::to_string(lookback_years));
            }
        }

        Eigen::VectorXd CashFlowProjector::historical_free_cash_flows(const FinancialInputBundle &bundle) const
        {
            const Eigen::Index n_years = bundle.num_years();
            const Eigen::Index window = std::min<Eigen::Index>(lookback_years_, n_years);

            return bundle.historical_free_cash_flow().tail(window);
        }

        double CashFlowProjector::historical_fcf_margin(const FinancialInputBundle &bundle) const
        {
            const Eigen::Index n_years = bundle.num_years();
            const Eigen::Index window = std::min<Eigen::Index>(lookback_years_, n_years);

            Eigen::VectorXd fcf = historical_free_cash_flows(bundle);
            Eigen::VectorXd revenue = bundle.revenue_history.tail(window);

            double margin_sum = 0.0;
            int counted = 0;
            for (Eigen::Index i = 0; i < window; ++i)
            {
                if (revenue(i) <= 0.0)
                {
                    continue;
                }
                margin_sum += fcf(i) / revenue(i);
                ++counted;
            }

            if (counted == 0)
            {
                throw DomainError(
                    "Cannot derive a free cash flow margin for '" + bundle.identifier +
                    "': no positive revenue in the last " + std::to_string(window) + " years");
            }

            return margin_sum / static_cast<double>(counted);
        }

        Eigen::VectorXd CashFlowProjector::project(const Eigen::VectorXd &projected_revenue,
                                                   double fcf_margin,
                                                   double margin_adjustment_factor)
        {
            return projected_revenue * (fcf_margin * margin_adjustment_factor);
        }

    } // namespace model
} // namespace valuation
