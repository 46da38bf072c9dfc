/**
 * @file dcf_engine.hpp
 * @brief Orchestrator for comprehensive multi-scenario DCF valuation
 *
 * Control flow of calculate_comprehensive_dcf():
 *
 *     1. validate bundle                 (ValidationError)
 *     2. assess quality and freshness    (warning only)
 *     3. base WACC
 *     4. resolve canonical scenarios     (discount_rate = WACC + offset, DomainError if r <= g)
 *        and check the custom scenario   (ValidationError, DomainError)
 *     5. run scenarios, join all         (concurrently when parallel_scenarios)
 *     6. sensitivity grid from base case
 *     7. assemble DCFAnalysisReport
 *
 * Any scenario failure fails the whole request; partial reports are never
 * returned. The engine holds only configuration, so one instance may serve
 * concurrent requests.
 */

#pragma once

#include "data/financial_inputs.hpp"
#include "engine/dcf_report.hpp"
#include "engine/engine_config.hpp"
#include "model/cost_of_capital.hpp"
#include "quality/quality_assessor.hpp"
#include "scenario/scenario_runner.hpp"
#include "sensitivity/sensitivity_grid.hpp"
#include <map>
#include <string>
#include <vector>

namespace valuation
{
    namespace engine
    {

        /**
         * @class DCFCalculationEngine
         * @brief Runs the three canonical scenarios and builds the sensitivity grid
         *
         * Usage Example:
         * @code
         * auto config = EngineConfig::from_json(BundleLoader::load_json("engine_config.json"));
         * DCFCalculationEngine engine(config);
         *
         * auto report = engine.calculate_comprehensive_dcf(bundle);
         * report.print_summary();
         *
         * std::cout << "Base case: "
         *           << report.scenario("base_case").intrinsic_value_per_share << "\n";
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class DCFCalculationEngine
        {
        public:
            /**
             * @brief Construct engine with default configuration
             */
            DCFCalculationEngine();

            /**
             * @brief Construct engine
             * @param config Engine configuration
             * @throws std::invalid_argument if config is invalid
             */
            explicit DCFCalculationEngine(const EngineConfig &config);

            ~DCFCalculationEngine() = default;

            /**
             * @brief Comprehensive valuation timestamped with the current time
             * @param bundle Financial inputs
             * @return Report with worst/base/best scenarios and sensitivity grid
             * @throws ValidationError if the bundle or a scenario is malformed
             * @throws DomainError if a scenario has discount_rate <= terminal_growth_rate
             */
            DCFAnalysisReport calculate_comprehensive_dcf(const FinancialInputBundle &bundle) const;

            /**
             * @brief Comprehensive valuation at an explicit report time
             * @param bundle Financial inputs
             * @param as_of Report timestamp (also the reference for data freshness)
             */
            DCFAnalysisReport calculate_comprehensive_dcf(const FinancialInputBundle &bundle,
                                                          Timestamp as_of) const;

            /**
             * @brief Comprehensive valuation with an additional custom scenario
             * @param bundle Financial inputs
             * @param custom Custom assumptions (discount_rate used as given)
             * @param as_of Report timestamp
             *
             * The custom result is stored under the "custom" key and does
             * not enter the sensitivity grid or the weighted value.
             * @throws ValidationError if custom is malformed or uses a canonical name
             * @throws DomainError if custom.discount_rate <= custom.terminal_growth_rate
             */
            DCFAnalysisReport calculate_comprehensive_dcf(const FinancialInputBundle &bundle,
                                                          const scenario::ScenarioAssumptions &custom,
                                                          Timestamp as_of) const;

            /**
             * @brief Ad-hoc valuation for a single scenario
             * @param bundle Financial inputs
             * @param assumptions Assumptions with an explicit discount rate
             * @return ScenarioResult
             * @throws ValidationError if bundle or assumptions are malformed
             * @throws DomainError if discount_rate <= terminal_growth_rate
             */
            scenario::ScenarioResult calculate_scenario_dcf(const FinancialInputBundle &bundle,
                                                            const scenario::ScenarioAssumptions &assumptions) const;

            /**
             * @brief Base WACC for a bundle
             */
            double calculate_base_wacc(const FinancialInputBundle &bundle) const;

            /**
             * @brief Canonical scenario with its discount rate resolved
             * @param type Canonical scenario type
             * @param base_wacc Base WACC
             * @return Assumptions with discount_rate = base_wacc + offset
             * @throws ValidationError if the table entry is malformed
             * @throws DomainError if the resolved rate does not exceed terminal growth
             */
            scenario::ScenarioAssumptions resolve_scenario(scenario::ScenarioType type,
                                                           double base_wacc) const;

            const EngineConfig &config() const { return config_; }

        private:
            EngineConfig config_;
            model::CostOfCapitalCalculator wacc_calculator_;
            quality::QualityAssessor quality_assessor_;
            scenario::ScenarioRunner runner_;
            sensitivity::SensitivityGridGenerator grid_generator_;

            /**
             * @brief Run resolved scenarios, joining all before returning
             *
             * Rethrows the first failure (in scenario order) after every task
             * has finished.
             */
            std::map<std::string, scenario::ScenarioResult> run_scenarios(
                const FinancialInputBundle &bundle,
                const std::vector<scenario::ScenarioAssumptions> &resolved) const;

            DCFAnalysisReport build_report(const FinancialInputBundle &bundle,
                                           const scenario::ScenarioAssumptions *custom,
                                           Timestamp as_of) const;

            static double probability_weighted_value(
                const std::map<std::string, scenario::ScenarioResult> &results);
        };

    } // namespace engine
} // namespace valuation
