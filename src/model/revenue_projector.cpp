/**
 * @file revenue_projector.cpp
 * @brief Implementation of revenue projection
 */

#include "model/revenue_projector.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace valuation
{
    namespace model
    {

        RevenueProjector::RevenueProjector(double historical_weight, double decay_factor)
            : historical_weight_(historical_weight),
              decay_factor_(decay_factor)
        {
            if (!std::isfinite(historical_weight) || historical_weight < 0.0 || historical_weight > 1.0)
            {
                throw std::invalid_argument(
                    "Expected value in [0, 1] for parameter 'historical_weight', got: " +
                    std::to_string(historical_weight));
            }

            if (!std::isfinite(decay_factor) || decay_factor <= 0.0 || decay_factor > 1.0)
            {
                throw std::invalid_argument(
                    "Expected value in (0, 1] for parameter 'decay_factor', got: " +
                    std::to_string(decay_factor));
            }
        }

        Eigen::VectorXd RevenueProjector::historical_growth_rates(const Eigen::VectorXd &revenue_history)
        {
            std::vector<double> rates;
            for (Eigen::Index i = 1; i < revenue_history.size(); ++i)
            {
                const double previous = revenue_history(i - 1);

                // A growth rate off a non-positive base is meaningless
                if (previous <= 0.0)
                {
                    continue;
                }
                rates.push_back((revenue_history(i) - previous) / previous);
            }

            return Eigen::Map<const Eigen::VectorXd>(rates.data(), static_cast<Eigen::Index>(rates.size()));
        }

        double RevenueProjector::mean_historical_growth(const Eigen::VectorXd &revenue_history)
        {
            Eigen::VectorXd rates = historical_growth_rates(revenue_history);
            if (rates.size() == 0)
            {
                return 0.0;
            }
            return rates.mean();
        }

        double RevenueProjector::blended_growth(const Eigen::VectorXd &revenue_history, double scenario_growth) const
        {
            return historical_weight_ * mean_historical_growth(revenue_history) +
                   (1.0 - historical_weight_) * scenario_growth;
        }

        Eigen::VectorXd RevenueProjector::project(const Eigen::VectorXd &revenue_history,
                                                  const scenario::ScenarioAssumptions &assumptions) const
        {
            if (revenue_history.size() == 0)
            {
                throw ValidationError("Cannot project revenue from an empty revenue history");
            }

            const int horizon = assumptions.projection_horizon_years;
            if (horizon < 1)
            {
                throw ValidationError(
                    "Scenario '" + assumptions.scenario_name +
                    "': projection_horizon_years must be at least 1, got: " + std::to_string(horizon));
            }

            const double blended = blended_growth(revenue_history, assumptions.revenue_growth_rate);
            const double terminal = assumptions.terminal_growth_rate;

            Eigen::VectorXd projected(horizon);
            double last_revenue = revenue_history(revenue_history.size() - 1);

            for (int year = 0; year < horizon; ++year)
            {
                const double decay = std::pow(decay_factor_, year);
                const double year_growth = blended * decay + terminal * (1.0 - decay);

                last_revenue = last_revenue * (1.0 + year_growth);
                projected(year) = last_revenue;
            }

            return projected;
        }

    } // namespace model
} // namespace valuation
