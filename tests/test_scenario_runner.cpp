/**
 * @file test_scenario_runner.cpp
 * @brief Unit tests for ScenarioAssumptions, ScenarioTable and ScenarioRunner
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "common/errors.hpp"
#include "scenario/scenario_assumptions.hpp"
#include "scenario/scenario_runner.hpp"
#include "test_helpers.hpp"

using namespace valuation;
using namespace valuation::scenario;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixture
// ============================================================================

class ScenarioRunnerFixture
{
protected:
    FinancialInputBundle bundle_ = testing::growth_company_bundle();
    ScenarioRunner runner_;

    ScenarioAssumptions base_case(double discount_rate = 0.09) const
    {
        return ScenarioTable::defaults().base_case.with_discount_rate(discount_rate);
    }
};

TEST_CASE("Default scenario table", "[ScenarioTable]") {
    ScenarioTable table = ScenarioTable::defaults();

    SECTION("Keys and names") {
        REQUIRE(table.get(ScenarioType::WORST_CASE).scenario_name == "worst_case");
        REQUIRE(table.get(ScenarioType::BASE_CASE).scenario_name == "base_case");
        REQUIRE(table.get(ScenarioType::BEST_CASE).scenario_name == "best_case");
        REQUIRE(canonical_scenarios().size() == 3);
        REQUIRE(to_string(ScenarioType::CUSTOM) == "custom");
    }

    SECTION("Assumptions are ordered from worst to best") {
        REQUIRE(table.worst_case.revenue_growth_rate < table.base_case.revenue_growth_rate);
        REQUIRE(table.base_case.revenue_growth_rate < table.best_case.revenue_growth_rate);
        REQUIRE(table.worst_case.margin_adjustment_factor < table.best_case.margin_adjustment_factor);
        REQUIRE(table.worst_case.discount_rate_offset > table.best_case.discount_rate_offset);
        REQUIRE(table.base_case.discount_rate_offset == 0.0);
    }

    SECTION("Confidence levels sum to one") {
        double total = table.worst_case.confidence_level + table.base_case.confidence_level +
                       table.best_case.confidence_level;
        REQUIRE_THAT(total, WithinAbs(1.0, 1e-12));
    }

    SECTION("Custom is not a table entry") {
        REQUIRE_THROWS_AS(table.get(ScenarioType::CUSTOM), std::invalid_argument);
    }

    SECTION("Partial JSON override keeps defaults") {
        auto parsed = ScenarioTable::from_json(nlohmann::json{{"best_case", {{"revenue_growth_rate", 0.12}}}});
        REQUIRE_THAT(parsed.best_case.revenue_growth_rate, WithinAbs(0.12, 1e-12));
        REQUIRE_THAT(parsed.best_case.margin_adjustment_factor, WithinAbs(1.15, 1e-12));
        REQUIRE(parsed.worst_case.scenario_name == "worst_case");
    }

    SECTION("Error: wrong field type") {
        REQUIRE_THROWS_AS(ScenarioTable::from_json(nlohmann::json{{"base_case", {{"confidence_level", "high"}}}}),
                          ValidationError);
    }
}

TEST_CASE("ScenarioAssumptions validation", "[ScenarioAssumptions]") {
    ScenarioAssumptions a = ScenarioTable::defaults().worst_case.with_discount_rate(0.10);

    SECTION("Valid") {
        REQUIRE_NOTHROW(a.validate());
        REQUIRE_NOTHROW(a.require_discount_above_growth());
    }

    SECTION("Error: confidence above one names the scenario") {
        a.confidence_level = 1.5;
        REQUIRE_THROWS_WITH(a.validate(), ContainsSubstring("worst_case") && ContainsSubstring("confidence_level"));
    }

    SECTION("Error: negative margin factor") {
        a.margin_adjustment_factor = -0.1;
        REQUIRE_THROWS_AS(a.validate(), ValidationError);
    }

    SECTION("Error: zero horizon") {
        a.projection_horizon_years = 0;
        REQUIRE_THROWS_AS(a.validate(), ValidationError);
    }

    SECTION("Error: discount rate not above terminal growth") {
        a.discount_rate = a.terminal_growth_rate;
        REQUIRE_THROWS_AS(a.require_discount_above_growth(), DomainError);
    }

    SECTION("Error: custom JSON missing discount rate") {
        nlohmann::json j = {{"scenario_name", "custom"},
                            {"revenue_growth_rate", 0.05},
                            {"margin_adjustment_factor", 1.0},
                            {"terminal_growth_rate", 0.02}};
        REQUIRE_THROWS_WITH(ScenarioAssumptions::from_json(j), ContainsSubstring("discount_rate"));
    }
}

TEST_CASE_METHOD(ScenarioRunnerFixture, "Single scenario valuation", "[ScenarioRunner]") {
    ScenarioResult r = runner_.run(bundle_, base_case());

    SECTION("Result carries its assumptions") {
        REQUIRE(r.scenario_name == "base_case");
        REQUIRE(r.discount_rate == 0.09);
        REQUIRE(r.terminal_growth_rate == 0.025);
        REQUIRE(r.assumptions.confidence_level == 0.5);
    }

    SECTION("Projection shapes") {
        REQUIRE(r.projected_revenues.size() == 5);
        REQUIRE(r.projected_cash_flows.size() == 5);
        REQUIRE(r.present_values.size() == 6);
    }

    SECTION("Discount rate exceeds terminal growth") {
        REQUIRE(r.discount_rate > r.terminal_growth_rate);
        REQUIRE(r.terminal_value > 0.0);
    }

    SECTION("Equity bridge") {
        REQUIRE_THAT(r.total_enterprise_value, WithinRel(r.present_values.sum(), 1e-12));
        REQUIRE_THAT(r.equity_value,
                     WithinRel(r.total_enterprise_value - bundle_.total_debt + bundle_.cash_and_equivalents, 1e-12));
        REQUIRE_THAT(r.intrinsic_value_per_share, WithinRel(r.equity_value / bundle_.shares_outstanding, 1e-12));
    }

    SECTION("Upside relative to market price") {
        double expected = (r.intrinsic_value_per_share - 100.0) / 100.0 * 100.0;
        REQUIRE_THAT(r.upside_downside_percentage, WithinAbs(expected, 1e-9));
    }

    SECTION("Terminal value share of enterprise value") {
        REQUIRE(r.terminal_value_share() > 0.0);
        REQUIRE(r.terminal_value_share() < 1.0);
    }

    SECTION("JSON output") {
        auto j = r.to_json();
        REQUIRE(j["scenario_name"].get<std::string>() == "base_case");
        REQUIRE(j["present_values"].size() == 6);
        REQUIRE(j["assumptions"]["terminal_growth_rate"].get<double>() == 0.025);
    }
}

TEST_CASE_METHOD(ScenarioRunnerFixture, "Scenario runner determinism and monotonicity", "[ScenarioRunner]") {
    SECTION("Identical inputs give identical outputs") {
        ScenarioResult a = runner_.run(bundle_, base_case());
        ScenarioResult b = runner_.run(bundle_, base_case());
        REQUIRE(a.intrinsic_value_per_share == b.intrinsic_value_per_share);
        REQUIRE((a.present_values - b.present_values).cwiseAbs().maxCoeff() == 0.0);
    }

    SECTION("Higher discount rate lowers value") {
        double cheap = runner_.run(bundle_, base_case(0.08)).intrinsic_value_per_share;
        double dear = runner_.run(bundle_, base_case(0.11)).intrinsic_value_per_share;
        REQUIRE(cheap > dear);
    }

    SECTION("Longer horizon changes the projection length") {
        ScenarioAssumptions a = base_case();
        a.projection_horizon_years = 8;
        ScenarioResult r = runner_.run(bundle_, a);
        REQUIRE(r.projected_cash_flows.size() == 8);
        REQUIRE(r.present_values.size() == 9);
    }
}

TEST_CASE_METHOD(ScenarioRunnerFixture, "Scenario runner failures", "[ScenarioRunner]") {
    SECTION("Error: discount rate below terminal growth names the scenario") {
        ScenarioAssumptions a = base_case(0.02);
        REQUIRE_THROWS_AS(runner_.run(bundle_, a), DomainError);
        REQUIRE_THROWS_WITH(runner_.run(bundle_, a), ContainsSubstring("base_case"));
    }

    SECTION("Error: malformed assumptions") {
        ScenarioAssumptions a = base_case();
        a.confidence_level = -0.5;
        REQUIRE_THROWS_AS(runner_.run(bundle_, a), ValidationError);
    }

    SECTION("Error: no positive revenue for the margin") {
        bundle_.revenue_history << 80e6, 86e6, 0, -1e6, 0;
        REQUIRE_THROWS_AS(runner_.run(bundle_, base_case()), DomainError);
    }
}
