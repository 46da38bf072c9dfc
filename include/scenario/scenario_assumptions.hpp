/**
 * @file scenario_assumptions.hpp
 * @brief Named valuation scenarios and the canonical scenario table
 *
 * A scenario is a set of forward-looking assumptions (revenue growth,
 * margin adjustment, discount rate, terminal growth) that produces one
 * independent valuation. The three canonical scenarios are configuration
 * data held in a ScenarioTable:
 *
 * Default table:
 * @code{.json}
 * {
 *   "worst_case": {"revenue_growth_rate": 0.02, "margin_adjustment_factor": 0.85,
 *                  "discount_rate_offset": 0.02, "terminal_growth_rate": 0.020,
 *                  "confidence_level": 0.25},
 *   "base_case":  {"revenue_growth_rate": 0.05, "margin_adjustment_factor": 1.00,
 *                  "discount_rate_offset": 0.00, "terminal_growth_rate": 0.025,
 *                  "confidence_level": 0.50},
 *   "best_case":  {"revenue_growth_rate": 0.08, "margin_adjustment_factor": 1.15,
 *                  "discount_rate_offset": -0.01, "terminal_growth_rate": 0.030,
 *                  "confidence_level": 0.25}
 * }
 * @endcode
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace valuation
{
    namespace scenario
    {

        /**
         * @enum ScenarioType
         * @brief Canonical scenario identifiers
         */
        enum class ScenarioType
        {
            WORST_CASE, ///< Conservative assumptions, higher discount rate
            BASE_CASE,  ///< Central assumptions at the base WACC
            BEST_CASE,  ///< Optimistic assumptions, lower discount rate
            CUSTOM      ///< Caller-supplied assumptions
        };

        /**
         * @brief Report key for a scenario type ("worst_case", "base_case", ...)
         */
        std::string to_string(ScenarioType type);

        /**
         * @brief The three canonical scenario types in report order
         */
        const std::vector<ScenarioType> &canonical_scenarios();

        /**
         * @struct ScenarioAssumptions
         * @brief Assumptions for one named scenario
         *
         * For canonical scenarios discount_rate is resolved by the engine as
         * base WACC + discount_rate_offset. For custom scenarios the caller
         * sets discount_rate directly.
         *
         * Invariant: discount_rate > terminal_growth_rate. A violation is a
         * DomainError at calculation time and is never clamped.
         */
        struct ScenarioAssumptions
        {
            std::string scenario_name = "custom";  ///< Report key
            double revenue_growth_rate = 0.0;      ///< Near-term revenue growth
            double margin_adjustment_factor = 1.0; ///< Multiplier on historical FCF margin
            double discount_rate = 0.0;            ///< Discount rate (resolved for canonical scenarios)
            double discount_rate_offset = 0.0;     ///< Shift from base WACC (canonical scenarios)
            double terminal_growth_rate = 0.0;     ///< Perpetual growth after the horizon
            double confidence_level = 0.0;         ///< Scenario weight in [0, 1]
            int projection_horizon_years = 5;      ///< Explicit projection years

            /**
             * @brief Check shape constraints (not the discount/growth relation)
             * @throws ValidationError naming the scenario and the offending field
             */
            void validate() const;

            /**
             * @brief Enforce discount_rate > terminal_growth_rate
             * @throws DomainError naming the scenario and both rates
             */
            void require_discount_above_growth() const;

            /**
             * @brief Copy with a resolved discount rate
             */
            ScenarioAssumptions with_discount_rate(double rate) const;

            /**
             * @brief Create custom scenario from JSON
             * @param j JSON object
             * @return Parsed assumptions
             * @throws ValidationError if a required field is missing
             *
             * Required: revenue_growth_rate, margin_adjustment_factor,
             * discount_rate, terminal_growth_rate.
             * Optional: scenario_name ("custom"), confidence_level (0.0),
             * projection_horizon_years (5).
             */
            static ScenarioAssumptions from_json(const nlohmann::json &j);

            /**
             * @brief Convert to JSON
             */
            nlohmann::json to_json() const;
        };

        /**
         * @struct ScenarioTable
         * @brief Fixed mapping {worst_case, base_case, best_case} -> assumptions
         */
        struct ScenarioTable
        {
            ScenarioAssumptions worst_case;
            ScenarioAssumptions base_case;
            ScenarioAssumptions best_case;

            /**
             * @brief Table entry for a canonical scenario
             * @throws std::invalid_argument for ScenarioType::CUSTOM
             */
            const ScenarioAssumptions &get(ScenarioType type) const;

            /**
             * @brief Default table (see file documentation)
             */
            static ScenarioTable defaults();

            /**
             * @brief Validate every entry
             * @throws ValidationError on the first malformed entry
             */
            void validate() const;

            /**
             * @brief Create table from JSON, filling missing entries and fields from defaults
             */
            static ScenarioTable from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

    } // namespace scenario
} // namespace valuation
