/**
 * @file engine_config.hpp
 * @brief Configuration for the DCF calculation engine
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "engine": {
 *     "debt_spread": 0.02,
 *     "historical_growth_weight": 0.3,
 *     "growth_decay_factor": 0.8,
 *     "fcf_lookback_years": 3,
 *     "quality_warning_threshold": 0.5,
 *     "parallel_scenarios": true,
 *     "verbose": false,
 *     "sensitivity": {"num_points": 9, "wacc_step": 0.005, "growth_step": 0.0025},
 *     "scenarios": {
 *       "worst_case": {"revenue_growth_rate": 0.02, "discount_rate_offset": 0.02}
 *     }
 *   }
 * }
 * @endcode
 *
 * Every field is optional; missing fields take the defaults shown above and
 * missing scenario fields take the default scenario table.
 */

#pragma once

#include "scenario/scenario_assumptions.hpp"
#include "sensitivity/sensitivity_grid.hpp"
#include <nlohmann/json.hpp>

namespace valuation
{
    namespace engine
    {

        /**
         * @struct EngineConfig
         * @brief All tunable parameters of DCFCalculationEngine
         */
        struct EngineConfig
        {
            double debt_spread = 0.02;               ///< Cost of debt spread over r_f
            double historical_growth_weight = 0.3;   ///< Weight of historical growth in the blend
            double growth_decay_factor = 0.8;        ///< Per-year decay toward terminal growth
            int fcf_lookback_years = 3;              ///< Years used for the FCF margin
            double quality_warning_threshold = 0.5;  ///< Quality score below which a warning is raised
            bool parallel_scenarios = true;          ///< Evaluate canonical scenarios concurrently
            bool verbose = false;                    ///< Progress output to stdout

            sensitivity::SensitivityConfig sensitivity;                            ///< Grid shape
            scenario::ScenarioTable scenarios = scenario::ScenarioTable::defaults(); ///< Canonical scenarios

            /**
             * @brief Validate all parameters
             * @throws std::invalid_argument if a parameter is out of range
             * @throws ValidationError if a scenario table entry is malformed
             */
            void validate() const;

            /**
             * @brief Create configuration from JSON
             * @param j Either the engine object itself or a document with an "engine" key
             * @return EngineConfig with defaults for missing fields
             * @throws ValidationError if a field has the wrong type
             */
            static EngineConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

    } // namespace engine
} // namespace valuation
