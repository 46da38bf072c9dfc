/**
 * @file dcf_engine.cpp
 * @brief Implementation of the comprehensive DCF orchestrator
 */

#include "engine/dcf_engine.hpp"
#include "common/errors.hpp"
#include <exception>
#include <future>
#include <iomanip>
#include <iostream>

namespace valuation
{
    namespace engine
    {

        DCFCalculationEngine::DCFCalculationEngine()
            : DCFCalculationEngine(EngineConfig())
        {
        }

        DCFCalculationEngine::DCFCalculationEngine(const EngineConfig &config)
            : config_(config),
              wacc_calculator_(config.debt_spread),
              quality_assessor_(),
              runner_(model::RevenueProjector(config.historical_growth_weight, config.growth_decay_factor),
                      model::CashFlowProjector(config.fcf_lookback_years)),
              grid_generator_(config.sensitivity)
        {
            config_.validate();
        }

        DCFAnalysisReport DCFCalculationEngine::calculate_comprehensive_dcf(
            const FinancialInputBundle &bundle) const
        {
            return build_report(bundle, nullptr, std::chrono::system_clock::now());
        }

        DCFAnalysisReport DCFCalculationEngine::calculate_comprehensive_dcf(
            const FinancialInputBundle &bundle,
            Timestamp as_of) const
        {
            return build_report(bundle, nullptr, as_of);
        }

        DCFAnalysisReport DCFCalculationEngine::calculate_comprehensive_dcf(
            const FinancialInputBundle &bundle,
            const scenario::ScenarioAssumptions &custom,
            Timestamp as_of) const
        {
            return build_report(bundle, &custom, as_of);
        }

        scenario::ScenarioResult DCFCalculationEngine::calculate_scenario_dcf(
            const FinancialInputBundle &bundle,
            const scenario::ScenarioAssumptions &assumptions) const
        {
            bundle.validate();
            return runner_.run(bundle, assumptions);
        }

        double DCFCalculationEngine::calculate_base_wacc(const FinancialInputBundle &bundle) const
        {
            return wacc_calculator_.calculate_wacc(bundle);
        }

        scenario::ScenarioAssumptions DCFCalculationEngine::resolve_scenario(
            scenario::ScenarioType type,
            double base_wacc) const
        {
            const scenario::ScenarioAssumptions &entry = config_.scenarios.get(type);
            scenario::ScenarioAssumptions resolved = entry.with_discount_rate(base_wacc + entry.discount_rate_offset);
            resolved.validate();
            resolved.require_discount_above_growth();
            return resolved;
        }

        std::map<std::string, scenario::ScenarioResult> DCFCalculationEngine::run_scenarios(
            const FinancialInputBundle &bundle,
            const std::vector<scenario::ScenarioAssumptions> &resolved) const
        {
            std::vector<scenario::ScenarioResult> results(resolved.size());

            if (config_.parallel_scenarios)
            {
                std::vector<std::future<scenario::ScenarioResult>> futures;
                futures.reserve(resolved.size());
                for (const auto &assumptions : resolved)
                {
                    futures.push_back(std::async(std::launch::async,
                                                 [this, &bundle, &assumptions]()
                                                 {
                                                     return runner_.run(bundle, assumptions);
                                                 }));
                }

                // Join every task before surfacing a failure
                std::exception_ptr first_error;
                for (size_t i = 0; i < futures.size(); ++i)
                {
                    try
                    {
                        results[i] = futures[i].get();
                    }
                    catch (const std::exception &)
                    {
                        if (!first_error)
                        {
                            first_error = std::current_exception();
                        }
                    }
                }

                if (first_error)
                {
                    std::rethrow_exception(first_error);
                }
            }
            else
            {
                for (size_t i = 0; i < resolved.size(); ++i)
                {
                    results[i] = runner_.run(bundle, resolved[i]);
                }
            }

            std::map<std::string, scenario::ScenarioResult> by_name;
            for (auto &result : results)
            {
                by_name[result.scenario_name] = std::move(result);
            }
            return by_name;
        }

        double DCFCalculationEngine::probability_weighted_value(
            const std::map<std::string, scenario::ScenarioResult> &results)
        {
            double weighted_sum = 0.0;
            double total_confidence = 0.0;

            for (auto type : scenario::canonical_scenarios())
            {
                auto it = results.find(scenario::to_string(type));
                if (it == results.end())
                {
                    continue;
                }
                const double confidence = it->second.assumptions.confidence_level;
                weighted_sum += it->second.intrinsic_value_per_share * confidence;
                total_confidence += confidence;
            }

            if (total_confidence <= 0.0)
            {
                return results.at("base_case").intrinsic_value_per_share;
            }
            return weighted_sum / total_confidence;
        }

        DCFAnalysisReport DCFCalculationEngine::build_report(
            const FinancialInputBundle &bundle,
            const scenario::ScenarioAssumptions *custom,
            Timestamp as_of) const
        {
            // 1. Reject malformed input before any computation
            bundle.validate();

            if (config_.verbose)
            {
                std::cout << "Running DCF analysis for " << bundle.identifier
                          << " (" << bundle.num_years() << " years of history)" << std::endl;
            }

            // 2. Data quality
            quality::QualityAssessment assessment = quality_assessor_.assess(bundle);
            const double freshness = quality::QualityAssessor::assess_freshness(bundle.last_updated, as_of);
            const bool quality_warning = assessment.below(config_.quality_warning_threshold);

            if (quality_warning)
            {
                std::cerr << "Warning: data quality for " << bundle.identifier << " is "
                          << std::fixed << std::setprecision(2) << assessment.score
                          << " (grade " << assessment.grade << "), below threshold "
                          << config_.quality_warning_threshold << std::endl;
            }

            // 3. Base cost of capital
            const double base_wacc = calculate_base_wacc(bundle);

            if (config_.verbose)
            {
                std::cout << "  Base WACC: " << std::fixed << std::setprecision(4)
                          << base_wacc * 100 << "%" << std::endl;
            }

            // 4. Resolve every scenario before launching any work
            std::vector<scenario::ScenarioAssumptions> resolved;
            for (auto type : scenario::canonical_scenarios())
            {
                resolved.push_back(resolve_scenario(type, base_wacc));
            }

            if (custom != nullptr)
            {
                for (auto type : scenario::canonical_scenarios())
                {
                    if (custom->scenario_name == scenario::to_string(type))
                    {
                        throw ValidationError("Custom scenario cannot reuse the canonical name '" +
                                              custom->scenario_name + "'");
                    }
                }
                custom->validate();
                custom->require_discount_above_growth();
            }

            // 5. Canonical scenarios
            std::map<std::string, scenario::ScenarioResult> results = run_scenarios(bundle, resolved);

            if (config_.verbose)
            {
                for (const auto &entry : results)
                {
                    std::cout << "  " << std::setw(12) << std::left << entry.first << std::right
                              << " r=" << std::setprecision(4) << entry.second.discount_rate
                              << " value/share=" << std::setprecision(2)
                              << entry.second.intrinsic_value_per_share << std::endl;
                }
            }

            DCFAnalysisReport report;

            // 6. Sensitivity around the base case
            report.sensitivity_grid = grid_generator_.generate(bundle, results.at("base_case"));
            report.probability_weighted_value = probability_weighted_value(results);

            if (custom != nullptr)
            {
                results["custom"] = runner_.run(bundle, *custom);
            }

            if (config_.verbose)
            {
                std::cout << "  Sensitivity grid: " << report.sensitivity_grid.num_valid_cells()
                          << " valid cells" << std::endl;
            }

            // 7. Assemble
            report.identifier = bundle.identifier;
            report.current_market_price = bundle.current_price;
            report.scenarios = std::move(results);
            report.base_wacc = base_wacc;
            report.quality_score = assessment.score;
            report.quality_grade = assessment.grade;
            report.quality_issues = assessment.issues;
            report.quality_warning = quality_warning;
            report.data_freshness_score = freshness;
            report.recommendations = quality::QualityAssessor::recommendations(assessment, freshness);
            report.timestamp = as_of;

            return report;
        }

    } // namespace engine
} // namespace valuation
