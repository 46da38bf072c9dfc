/**
 * @file dcf_report.hpp
 * @brief Top-level output of a comprehensive DCF analysis
 */

#pragma once

#include "common/timestamp.hpp"
#include "scenario/scenario_result.hpp"
#include "sensitivity/sensitivity_grid.hpp"
#include <map>
#include <string>
#include <vector>

namespace valuation
{
    namespace engine
    {

        /**
         * @struct DCFAnalysisReport
         * @brief Multi-scenario valuation, sensitivity surface and data-quality metadata
         *
         * scenarios always holds "worst_case", "base_case" and "best_case";
         * "custom" is present only when a custom scenario was requested.
         */
        struct DCFAnalysisReport
        {
            std::string identifier;                                  ///< Ticker symbol
            double current_market_price = 0.0;                       ///< Price at valuation time
            std::map<std::string, scenario::ScenarioResult> scenarios; ///< Keyed by scenario name
            sensitivity::SensitivityGrid sensitivity_grid;           ///< Around the base case
            double base_wacc = 0.0;                                  ///< Unadjusted WACC

            double quality_score = 0.0;                              ///< Input reliability in [0, 1]
            std::string quality_grade;                               ///< A-F
            std::vector<std::string> quality_issues;                 ///< Deductions applied
            bool quality_warning = false;                            ///< quality_score below threshold
            std::vector<std::string> recommendations;                ///< Data-layer remediations
            double data_freshness_score = 0.0;                       ///< Recency of inputs in [0, 1]

            double probability_weighted_value = 0.0;                 ///< Confidence-weighted value per share
            Timestamp timestamp{};                                   ///< When the report was assembled

            /**
             * @brief Result for a scenario key
             * @throws std::out_of_range if the scenario is not in the report
             */
            const scenario::ScenarioResult &scenario(const std::string &name) const;

            /**
             * @brief Check whether a scenario key is present
             */
            bool has_scenario(const std::string &name) const;

            /**
             * @brief Full report as JSON
             */
            nlohmann::json to_json() const;

            /**
             * @brief Write one row per scenario to CSV
             * @throws std::runtime_error if the file cannot be opened
             */
            void export_scenarios_csv(const std::string &filepath) const;

            /**
             * @brief Print a rounded summary to stdout
             */
            void print_summary() const;
        };

    } // namespace engine
} // namespace valuation
