/**
 * @file revenue_projector.hpp
 * @brief Multi-year revenue projection with growth decay
 *
 * Blends the historical average growth rate with the scenario growth rate
 * and lets the blend relax toward the terminal growth rate:
 *
 *     g_blend  = w_hist * mean(historical YoY growth) + (1 - w_hist) * g_scenario
 *     decay_y  = d^y                                   (y = 0, 1, ..., H-1)
 *     g_y      = g_blend * decay_y + g_terminal * (1 - decay_y)
 *     R_{y+1}  = R_y * (1 + g_y)
 *
 * Defaults: w_hist = 0.3, d = 0.8.
 */

#pragma once

#include "scenario/scenario_assumptions.hpp"
#include <Eigen/Dense>

namespace valuation
{
    namespace model
    {

        /**
         * @class RevenueProjector
         * @brief Extrapolates revenue over the scenario's projection horizon
         *
         * Usage Example:
         * @code
         * RevenueProjector projector;
         * Eigen::VectorXd revenue = projector.project(bundle.revenue_history, assumptions);
         * @endcode
         */
        class RevenueProjector
        {
        public:
            static constexpr double DEFAULT_HISTORICAL_WEIGHT = 0.3;
            static constexpr double DEFAULT_DECAY_FACTOR = 0.8;

            /**
             * @brief Construct projector
             * @param historical_weight Weight of historical growth in the blend, in [0, 1]
             * @param decay_factor Per-year decay toward terminal growth, in (0, 1]
             * @throws std::invalid_argument if a parameter is out of range
             */
            explicit RevenueProjector(double historical_weight = DEFAULT_HISTORICAL_WEIGHT,
                                      double decay_factor = DEFAULT_DECAY_FACTOR);

            /**
             * @brief Project revenue
             * @param revenue_history Chronological revenue history (at least 1 entry)
             * @param assumptions Scenario assumptions (growth, terminal growth, horizon)
             * @return Projected revenues, length = projection_horizon_years
             * @throws ValidationError if history is empty or horizon < 1
             */
            Eigen::VectorXd project(const Eigen::VectorXd &revenue_history,
                                    const scenario::ScenarioAssumptions &assumptions) const;

            /**
             * @brief Blended near-term growth rate
             */
            double blended_growth(const Eigen::VectorXd &revenue_history, double scenario_growth) const;

            /**
             * @brief Year-over-year growth rates
             * @param revenue_history Chronological revenue history
             * @return Growth rates for every year whose prior-year revenue is positive
             */
            static Eigen::VectorXd historical_growth_rates(const Eigen::VectorXd &revenue_history);

            /**
             * @brief Mean historical growth rate (0.0 if no rate can be computed)
             */
            static double mean_historical_growth(const Eigen::VectorXd &revenue_history);

            double get_historical_weight() const { return historical_weight_; }
            double get_decay_factor() const { return decay_factor_; }

        private:
            double historical_weight_; ///< Weight of historical growth
            double decay_factor_;      ///< Growth decay per projection year
        };

    } // namespace model
} // namespace valuation
