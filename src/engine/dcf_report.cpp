/**
 * @file dcf_report.cpp
 * @brief Implementation of DCFAnalysisReport accessors and export
 */

#include "engine/dcf_report.hpp"
#include "quality/quality_assessor.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace valuation
{
    namespace engine
    {

        const scenario::ScenarioResult &DCFAnalysisReport::scenario(const std::string &name) const
        {
            auto it = scenarios.find(name);
            if (it == scenarios.end())
            {
                throw std::out_of_range("Scenario '" + name + "' is not part of the report for " + identifier);
            }
            return it->second;
        }

        bool DCFAnalysisReport::has_scenario(const std::string &name) const
        {
            return scenarios.find(name) != scenarios.end();
        }

        nlohmann::json DCFAnalysisReport::to_json() const
        {
            nlohmann::json j;
            j["identifier"] = identifier;
            j["current_market_price"] = current_market_price;
            j["timestamp"] = format_iso8601(timestamp);
            j["base_wacc"] = base_wacc;

            for (const auto &entry : scenarios)
            {
                j["scenarios"][entry.first] = entry.second.to_json();
            }

            j["sensitivity_grid"] = sensitivity_grid.to_json();
            j["probability_weighted_value"] = probability_weighted_value;

            j["data_quality"]["quality_score"] = quality_score;
            j["data_quality"]["quality_grade"] = quality_grade;
            j["data_quality"]["quality_level"] = quality::QualityAssessor::quality_level(quality_score);
            j["data_quality"]["quality_warning"] = quality_warning;
            j["data_quality"]["issues"] = quality_issues;
            j["data_quality"]["recommendations"] = recommendations;
            j["data_quality"]["data_freshness_score"] = data_freshness_score;

            return j;
        }

        void DCFAnalysisReport::export_scenarios_csv(const std::string &filepath) const
        {
            std::ofstream out(filepath);
            if (!out)
            {
                throw std::runtime_error("unable to open file for writing: " + filepath);
            }

            out << "scenario,discount_rate,terminal_growth_rate,enterprise_value,terminal_value,"
                   "equity_value,intrinsic_value_per_share,upside_downside_percentage\n";
            out << std::fixed << std::setprecision(8);

            for (const auto &entry : scenarios)
            {
                const auto &r = entry.second;
                out << entry.first << ","
                    << r.discount_rate << ","
                    << r.terminal_growth_rate << ","
                    << r.total_enterprise_value << ","
                    << r.terminal_value << ","
                    << r.equity_value << ","
                    << r.intrinsic_value_per_share << ","
                    << r.upside_downside_percentage << "\n";
            }
        }

        void DCFAnalysisReport::print_summary() const
        {
            std::cout << "\n=== DCF Analysis: " << identifier << " ===\n";
            std::cout << "Timestamp:         " << format_iso8601(timestamp) << "\n";
            std::cout << "Market Price:      " << std::fixed << std::setprecision(2)
                      << current_market_price << "\n";
            std::cout << "Base WACC:         " << base_wacc * 100 << "%\n";
            std::cout << "Data Quality:      " << quality_score << " (" << quality_grade << ")"
                      << (quality_warning ? "  [WARNING]" : "") << "\n";
            std::cout << "Data Freshness:    " << data_freshness_score << "\n";

            for (const auto &issue : quality_issues)
            {
                std::cout << "  - " << issue << "\n";
            }

            std::cout << std::string(60, '-') << "\n";
            std::cout << std::setw(14) << std::left << "Scenario" << std::right
                      << std::setw(12) << "WACC"
                      << std::setw(12) << "Growth"
                      << std::setw(12) << "Value"
                      << std::setw(10) << "Upside" << "\n";

            for (const auto &entry : scenarios)
            {
                const auto &r = entry.second;
                std::cout << std::setw(14) << std::left << entry.first << std::right
                          << std::setw(11) << r.discount_rate * 100 << "%"
                          << std::setw(11) << r.terminal_growth_rate * 100 << "%"
                          << std::setw(12) << r.intrinsic_value_per_share
                          << std::setw(9) << r.upside_downside_percentage << "%\n";
            }

            std::cout << std::string(60, '-') << "\n";
            std::cout << "Probability-weighted value: " << probability_weighted_value << "\n";
            std::cout << "================================\n"
                      << std::endl;
        }

    } // namespace engine
} // namespace valuation
