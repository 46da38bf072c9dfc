/**
 * @file bundle_loader.hpp
 * @brief Loading of financial input bundles, engine configuration and
 *        custom scenarios from JSON files
 */

#ifndef VALUATION_DATA_BUNDLE_LOADER_HPP
#define VALUATION_DATA_BUNDLE_LOADER_HPP

#include "data/financial_inputs.hpp"
#include "engine/engine_config.hpp"
#include "scenario/scenario_assumptions.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace valuation {

/**
 * @class BundleLoader
 * @brief File-level entry points for all JSON inputs
 *
 * Expected bundle format:
 * @code{.json}
 * {
 *   "identifier": "ACME",
 *   "current_price": 100.0,
 *   "shares_outstanding": 1000000,
 *   "market_cap": 100000000,
 *   "revenue_history": [1000, 1100, 1200, 1300, 1400],
 *   "operating_cash_flow_history": [200, 220, 240, 260, 280],
 *   "capex_history": [50, 55, 60, 65, 70],
 *   "working_capital_change_history": [10, 12, 14, 16, 18],
 *   "total_debt": 500000,
 *   "cash_and_equivalents": 100000,
 *   "beta": 1.2,
 *   "risk_free_rate": 0.03,
 *   "market_risk_premium": 0.06,
 *   "effective_tax_rate": 0.25,
 *   "last_updated": "2024-01-15T16:00:00Z"
 * }
 * @endcode
 */
class BundleLoader {
public:
    BundleLoader() = default;
    ~BundleLoader() = default;

    /**
     * @brief Load a JSON document
     * @param filepath Path to JSON file
     * @return Parsed document
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load and validate a financial input bundle
     * @param filepath Path to bundle JSON file
     * @return Validated FinancialInputBundle
     * @throws std::runtime_error if the file cannot be read
     * @throws ValidationError if the content is malformed
     */
    static FinancialInputBundle load_bundle(const std::string& filepath);

    /**
     * @brief Load engine configuration
     * @param filepath Path to config JSON file
     * @return Validated EngineConfig
     */
    static engine::EngineConfig load_config(const std::string& filepath);

    /**
     * @brief Load custom scenario assumptions
     * @param filepath Path to scenario JSON file
     * @return Validated ScenarioAssumptions
     */
    static scenario::ScenarioAssumptions load_scenario(const std::string& filepath);

    /**
     * @brief Write a JSON document with two-space indentation
     * @throws std::runtime_error if the file cannot be opened
     */
    static void save_json(const nlohmann::json& j, const std::string& filepath);
};

} // namespace valuation

#endif // VALUATION_DATA_BUNDLE_LOADER_HPP
