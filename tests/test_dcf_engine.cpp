/**
 * @file test_dcf_engine.cpp
 * @brief Integration tests for DCFCalculationEngine and DCFAnalysisReport
 *
 * Tests the full valuation flow: validation, quality assessment, scenario
 * resolution, concurrent scenario evaluation, sensitivity grid and report
 * export.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "common/errors.hpp"
#include "engine/dcf_engine.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace valuation;
using namespace valuation::engine;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * @class DCFEngineFixture
 * @brief Growth company bundle and a fixed report time two hours after its update
 */
class DCFEngineFixture
{
protected:
    FinancialInputBundle bundle_;
    Timestamp as_of_;

    DCFEngineFixture()
        : bundle_(testing::growth_company_bundle()),
          as_of_(bundle_.last_updated + std::chrono::hours(2))
    {
    }

    static void require_identical(const scenario::ScenarioResult &a, const scenario::ScenarioResult &b)
    {
        REQUIRE(a.intrinsic_value_per_share == b.intrinsic_value_per_share);
        REQUIRE(a.total_enterprise_value == b.total_enterprise_value);
        REQUIRE(a.terminal_value == b.terminal_value);
        REQUIRE((a.projected_cash_flows - b.projected_cash_flows).cwiseAbs().maxCoeff() == 0.0);
        REQUIRE((a.present_values - b.present_values).cwiseAbs().maxCoeff() == 0.0);
    }
};

TEST_CASE("DCFCalculationEngine construction", "[DCFEngine]") {
    SECTION("Default configuration") {
        DCFCalculationEngine engine;
        REQUIRE(engine.config().sensitivity.num_points == 9);
        REQUIRE(engine.config().parallel_scenarios);
    }

    SECTION("Error: invalid configuration") {
        EngineConfig config;
        config.growth_decay_factor = 0.0;
        REQUIRE_THROWS_AS(DCFCalculationEngine(config), std::invalid_argument);
    }

    SECTION("Error: malformed scenario table") {
        EngineConfig config;
        config.scenarios.best_case.confidence_level = 2.0;
        REQUIRE_THROWS_AS(DCFCalculationEngine(config), ValidationError);
    }

    SECTION("Configuration JSON round trip") {
        EngineConfig config;
        config.debt_spread = 0.015;
        config.scenarios.worst_case.discount_rate_offset = 0.03;
        EngineConfig parsed = EngineConfig::from_json(config.to_json());
        REQUIRE_THAT(parsed.debt_spread, WithinAbs(0.015, 1e-12));
        REQUIRE_THAT(parsed.scenarios.worst_case.discount_rate_offset, WithinAbs(0.03, 1e-12));
    }
}

TEST_CASE_METHOD(DCFEngineFixture, "Comprehensive DCF report", "[DCFEngine]") {
    DCFCalculationEngine engine;
    DCFAnalysisReport report = engine.calculate_comprehensive_dcf(bundle_, as_of_);

    SECTION("Report header") {
        REQUIRE(report.identifier == "ACME");
        REQUIRE(report.current_market_price == 100.0);
        REQUIRE(report.timestamp == as_of_);
    }

    SECTION("Exactly the three canonical scenarios") {
        REQUIRE(report.scenarios.size() == 3);
        REQUIRE(report.has_scenario("worst_case"));
        REQUIRE(report.has_scenario("base_case"));
        REQUIRE(report.has_scenario("best_case"));
        REQUIRE_FALSE(report.has_scenario("custom"));
        REQUIRE_THROWS_AS(report.scenario("custom"), std::out_of_range);
    }

    SECTION("Discount rates are the base WACC plus each offset") {
        double wacc = engine.calculate_base_wacc(bundle_);
        REQUIRE(report.base_wacc == wacc);
        REQUIRE(report.scenario("base_case").discount_rate == wacc);
        REQUIRE_THAT(report.scenario("worst_case").discount_rate, WithinAbs(wacc + 0.02, 1e-12));
        REQUIRE_THAT(report.scenario("best_case").discount_rate, WithinAbs(wacc - 0.01, 1e-12));
    }

    SECTION("Every scenario has r > g") {
        for (const auto &entry : report.scenarios) {
            REQUIRE(entry.second.discount_rate > entry.second.terminal_growth_rate);
        }
    }

    SECTION("Worst <= base <= best") {
        REQUIRE(report.scenario("worst_case").intrinsic_value_per_share <=
                report.scenario("base_case").intrinsic_value_per_share);
        REQUIRE(report.scenario("base_case").intrinsic_value_per_share <=
                report.scenario("best_case").intrinsic_value_per_share);
    }

    SECTION("Grid is centered on the base case") {
        REQUIRE(report.sensitivity_grid.base_case_value == report.scenario("base_case").intrinsic_value_per_share);
        REQUIRE(report.sensitivity_grid.wacc_axis(4) == report.scenario("base_case").discount_rate);
    }

    SECTION("Grid reuses base case cash flows rather than re-projecting") {
        const auto &base = report.scenario("base_case");
        const auto &grid = report.sensitivity_grid;
        double expected = sensitivity::SensitivityGridGenerator::cell_value(
            bundle_, base.projected_cash_flows, grid.wacc_axis(0), grid.growth_axis(8));
        REQUIRE(grid.value_matrix(0, 8) == expected);
    }

    SECTION("Data quality metadata") {
        REQUIRE(report.quality_score == 1.0);
        REQUIRE(report.quality_grade == "A");
        REQUIRE_FALSE(report.quality_warning);
        REQUIRE(report.data_freshness_score == 0.9);
        REQUIRE(report.recommendations.empty());
    }

    SECTION("Probability-weighted value") {
        double expected = 0.25 * report.scenario("worst_case").intrinsic_value_per_share +
                          0.50 * report.scenario("base_case").intrinsic_value_per_share +
                          0.25 * report.scenario("best_case").intrinsic_value_per_share;
        REQUIRE_THAT(report.probability_weighted_value, WithinRel(expected, 1e-12));
    }
}

TEST_CASE_METHOD(DCFEngineFixture, "Worked example", "[DCFEngine]") {
    DCFCalculationEngine engine;
    auto bundle = testing::worked_example_bundle();
    DCFAnalysisReport report = engine.calculate_comprehensive_dcf(bundle, bundle.last_updated);

    REQUIRE(report.base_wacc > 0.05);
    REQUIRE(report.base_wacc < 0.15);
    REQUIRE(report.data_freshness_score == 1.0);

    // Debt dwarfs enterprise value, but ordering still holds
    REQUIRE(report.scenario("base_case").equity_value < 0.0);
    REQUIRE(report.scenario("worst_case").intrinsic_value_per_share <=
            report.scenario("base_case").intrinsic_value_per_share);
    REQUIRE(report.scenario("base_case").intrinsic_value_per_share <=
            report.scenario("best_case").intrinsic_value_per_share);
}

TEST_CASE_METHOD(DCFEngineFixture, "Determinism", "[DCFEngine]") {
    DCFCalculationEngine engine;

    SECTION("Two identical calls are bit-for-bit identical") {
        DCFAnalysisReport a = engine.calculate_comprehensive_dcf(bundle_, as_of_);
        DCFAnalysisReport b = engine.calculate_comprehensive_dcf(bundle_, as_of_);

        for (const auto &entry : a.scenarios) {
            require_identical(entry.second, b.scenario(entry.first));
        }
        REQUIRE(a.to_json().dump() == b.to_json().dump());
    }

    SECTION("Sequential execution matches concurrent execution") {
        EngineConfig config;
        config.parallel_scenarios = false;
        config.sensitivity.parallel = false;
        DCFCalculationEngine sequential(config);

        DCFAnalysisReport a = engine.calculate_comprehensive_dcf(bundle_, as_of_);
        DCFAnalysisReport b = sequential.calculate_comprehensive_dcf(bundle_, as_of_);

        for (const auto &entry : a.scenarios) {
            require_identical(entry.second, b.scenario(entry.first));
        }
        REQUIRE((a.sensitivity_grid.value_matrix - b.sensitivity_grid.value_matrix).cwiseAbs().maxCoeff() == 0.0);
    }
}

TEST_CASE_METHOD(DCFEngineFixture, "Custom scenario", "[DCFEngine]") {
    DCFCalculationEngine engine;

    scenario::ScenarioAssumptions custom;
    custom.scenario_name = "management_guidance";
    custom.revenue_growth_rate = 0.06;
    custom.margin_adjustment_factor = 1.05;
    custom.discount_rate = 0.095;
    custom.terminal_growth_rate = 0.025;
    custom.confidence_level = 0.5;
    custom.projection_horizon_years = 7;

    SECTION("Stored under the custom key") {
        DCFAnalysisReport report = engine.calculate_comprehensive_dcf(bundle_, custom, as_of_);
        REQUIRE(report.scenarios.size() == 4);
        REQUIRE(report.scenario("custom").scenario_name == "management_guidance");
        REQUIRE(report.scenario("custom").discount_rate == 0.095);
        REQUIRE(report.scenario("custom").projected_cash_flows.size() == 7);
    }

    SECTION("Custom scenario does not change canonical results") {
        DCFAnalysisReport with_custom = engine.calculate_comprehensive_dcf(bundle_, custom, as_of_);
        DCFAnalysisReport without = engine.calculate_comprehensive_dcf(bundle_, as_of_);
        require_identical(with_custom.scenario("base_case"), without.scenario("base_case"));
        REQUIRE(with_custom.probability_weighted_value == without.probability_weighted_value);
    }

    SECTION("Ad-hoc scenario matches the custom entry") {
        DCFAnalysisReport report = engine.calculate_comprehensive_dcf(bundle_, custom, as_of_);
        scenario::ScenarioResult adhoc = engine.calculate_scenario_dcf(bundle_, custom);
        require_identical(adhoc, report.scenario("custom"));
    }

    SECTION("Error: custom scenario with r <= g") {
        custom.discount_rate = 0.02;
        REQUIRE_THROWS_AS(engine.calculate_scenario_dcf(bundle_, custom), DomainError);
        REQUIRE_THROWS_AS(engine.calculate_comprehensive_dcf(bundle_, custom, as_of_), DomainError);
    }

    SECTION("Error: malformed custom scenario fails before any scenario runs") {
        EngineConfig config;
        config.verbose = true;
        DCFCalculationEngine verbose_engine(config);
        custom.projection_horizon_years = 0;

        std::ostringstream captured;
        std::streambuf *original = std::cout.rdbuf(captured.rdbuf());
        bool threw_validation = false;
        try {
            verbose_engine.calculate_comprehensive_dcf(bundle_, custom, as_of_);
        } catch (const ValidationError &) {
            threw_validation = true;
        }
        std::cout.rdbuf(original);

        REQUIRE(threw_validation);
        REQUIRE_THAT(captured.str(), ContainsSubstring("Base WACC"));
        REQUIRE(captured.str().find("value/share") == std::string::npos);
    }

    SECTION("Error: custom scenario reusing a canonical name") {
        custom.scenario_name = "base_case";
        REQUIRE_THROWS_AS(engine.calculate_comprehensive_dcf(bundle_, custom, as_of_), ValidationError);
        REQUIRE_THROWS_WITH(engine.calculate_comprehensive_dcf(bundle_, custom, as_of_),
                            ContainsSubstring("base_case"));
    }
}

TEST_CASE_METHOD(DCFEngineFixture, "Engine failures", "[DCFEngine]") {
    SECTION("Error: scenario with r <= g names the scenario") {
        EngineConfig config;
        // Best case lands at WACC - 0.10, below its terminal growth
        config.scenarios.best_case.discount_rate_offset = -0.10;
        DCFCalculationEngine engine(config);

        REQUIRE_THROWS_AS(engine.calculate_comprehensive_dcf(bundle_, as_of_), DomainError);
        REQUIRE_THROWS_WITH(engine.calculate_comprehensive_dcf(bundle_, as_of_), ContainsSubstring("best_case"));
    }

    SECTION("Error: invalid bundle fails before any calculation") {
        DCFCalculationEngine engine;
        bundle_.capex_history = Eigen::VectorXd::Zero(2);
        REQUIRE_THROWS_AS(engine.calculate_comprehensive_dcf(bundle_, as_of_), ValidationError);
    }

    SECTION("Error: scenario failure during concurrent evaluation") {
        DCFCalculationEngine engine;
        // Margin cannot be derived without positive recent revenue
        bundle_.revenue_history << 80e6, 86e6, 0.0, 0.0, 0.0;
        REQUIRE_THROWS_AS(engine.calculate_comprehensive_dcf(bundle_, as_of_), DomainError);
    }
}

TEST_CASE_METHOD(DCFEngineFixture, "Quality warning and freshness", "[DCFEngine]") {
    DCFCalculationEngine engine;

    SECTION("Low quality inputs still produce a report with a warning") {
        bundle_.market_cap = 0.0;
        bundle_.operating_cash_flow_history(0) = -1e6;
        DCFAnalysisReport report = engine.calculate_comprehensive_dcf(bundle_, as_of_);
        REQUIRE_THAT(report.quality_score, WithinAbs(0.5, 1e-12));
        REQUIRE(report.quality_grade == "D");
        REQUIRE(report.quality_issues.size() == 2);
        REQUIRE_FALSE(report.quality_warning);
        REQUIRE(report.recommendations.size() == 2);
    }

    SECTION("Warning below threshold") {
        EngineConfig config;
        config.quality_warning_threshold = 0.8;
        DCFCalculationEngine strict(config);
        bundle_.market_cap = 0.0;
        DCFAnalysisReport report = strict.calculate_comprehensive_dcf(bundle_, as_of_);
        REQUIRE(report.quality_warning);
    }

    SECTION("Stale data lowers freshness") {
        DCFAnalysisReport report =
            engine.calculate_comprehensive_dcf(bundle_, bundle_.last_updated + std::chrono::hours(24 * 7));
        REQUIRE(report.data_freshness_score == 0.3);
        REQUIRE_FALSE(report.recommendations.empty());
    }
}

TEST_CASE_METHOD(DCFEngineFixture, "Report export", "[DCFEngine]") {
    DCFCalculationEngine engine;
    DCFAnalysisReport report = engine.calculate_comprehensive_dcf(bundle_, as_of_);

    SECTION("JSON report") {
        auto j = report.to_json();
        REQUIRE(j["identifier"].get<std::string>() == "ACME");
        REQUIRE(j["timestamp"].get<std::string>() == "2024-06-28T22:00:00Z");
        REQUIRE(j["scenarios"].contains("worst_case"));
        REQUIRE(j["scenarios"].contains("base_case"));
        REQUIRE(j["scenarios"].contains("best_case"));
        REQUIRE(j["sensitivity_grid"]["value_matrix"].size() == 9);
        REQUIRE(j["data_quality"]["quality_grade"].get<std::string>() == "A");
        REQUIRE(j["data_quality"]["data_freshness_score"].get<double>() == 0.9);
    }

    SECTION("Scenario CSV has a header and one row per scenario") {
        auto path = (std::filesystem::temp_directory_path() / "dcf_test_scenarios.csv").string();
        report.export_scenarios_csv(path);

        std::ifstream in(path);
        std::string line;
        int lines = 0;
        while (std::getline(in, line)) {
            ++lines;
        }
        REQUIRE(lines == 4);
        std::filesystem::remove(path);
    }
}
