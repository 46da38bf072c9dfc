/**
 * @file test_sensitivity_grid.cpp
 * @brief Unit tests for SensitivityGridGenerator and SensitivityGrid
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "model/terminal_value.hpp"
#include "scenario/scenario_runner.hpp"
#include "sensitivity/sensitivity_grid.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

using namespace valuation;
using namespace valuation::sensitivity;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixture
// ============================================================================

class SensitivityGridFixture
{
protected:
    FinancialInputBundle bundle_;
    scenario::ScenarioResult base_case_;

    SensitivityGridFixture()
        : bundle_(testing::growth_company_bundle())
    {
        scenario::ScenarioRunner runner;
        base_case_ = runner.run(bundle_, scenario::ScenarioTable::defaults().base_case.with_discount_rate(0.09));
    }
};

TEST_CASE("SensitivityConfig validation", "[SensitivityGrid]") {
    SECTION("Defaults are valid") {
        SensitivityConfig config;
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.num_points == 9);
    }

    SECTION("Error: even number of points") {
        SensitivityConfig config;
        config.num_points = 4;
        REQUIRE_THROWS_AS(SensitivityGridGenerator(config), std::invalid_argument);
    }

    SECTION("Error: too few points") {
        SensitivityConfig config;
        config.num_points = 1;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Error: non-positive step") {
        SensitivityConfig config;
        config.wacc_step = 0.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
}

TEST_CASE("Axis construction", "[SensitivityGrid]") {
    Eigen::VectorXd axis = SensitivityGridGenerator::build_axis(0.10, 0.005, 5);
    REQUIRE(axis.size() == 5);
    REQUIRE(axis(2) == 0.10);
    REQUIRE_THAT(axis(0), WithinAbs(0.09, 1e-12));
    REQUIRE_THAT(axis(4), WithinAbs(0.11, 1e-12));
}

TEST_CASE_METHOD(SensitivityGridFixture, "Grid around the base case", "[SensitivityGrid]") {
    SensitivityGridGenerator generator;
    SensitivityGrid grid = generator.generate(bundle_, base_case_);

    SECTION("Shape") {
        REQUIRE(grid.wacc_axis.size() == 9);
        REQUIRE(grid.growth_axis.size() == 9);
        REQUIRE(grid.value_matrix.rows() == 9);
        REQUIRE(grid.value_matrix.cols() == 9);
        REQUIRE(grid.center_index() == 4);
    }

    SECTION("Axes are centered on the base case") {
        REQUIRE(grid.wacc_axis(4) == base_case_.discount_rate);
        REQUIRE(grid.growth_axis(4) == base_case_.terminal_growth_rate);
    }

    SECTION("Center cell equals the base case value") {
        REQUIRE(grid.value_matrix(4, 4) == base_case_.intrinsic_value_per_share);
        REQUIRE(grid.base_case_value == base_case_.intrinsic_value_per_share);
    }

    SECTION("All cells valid for a wide spread between r and g") {
        REQUIRE(grid.num_valid_cells() == 81);
    }

    SECTION("Value falls with discount rate and rises with growth") {
        for (Eigen::Index i = 1; i < 9; ++i) {
            REQUIRE(grid.value_matrix(i, 4) < grid.value_matrix(i - 1, 4));
            REQUIRE(grid.value_matrix(4, i) > grid.value_matrix(4, i - 1));
        }
        REQUIRE(grid.min_value() == grid.value_matrix(8, 0));
        REQUIRE(grid.max_value() == grid.value_matrix(0, 8));
    }

    SECTION("Cells reuse the base case cash flows") {
        // Off-center cell computed directly from base-case cash flows
        double r = grid.wacc_axis(1);
        double g = grid.growth_axis(6);
        double expected = SensitivityGridGenerator::cell_value(bundle_, base_case_.projected_cash_flows, r, g);
        REQUIRE(grid.value_matrix(1, 6) == expected);
    }

    SECTION("Parallel and sequential generation agree") {
        SensitivityConfig sequential;
        sequential.parallel = false;
        SensitivityGrid other = SensitivityGridGenerator(sequential).generate(bundle_, base_case_);
        REQUIRE((other.value_matrix - grid.value_matrix).cwiseAbs().maxCoeff() == 0.0);
    }
}

TEST_CASE_METHOD(SensitivityGridFixture, "Invalid cells", "[SensitivityGrid]") {
    SensitivityConfig config;
    config.num_points = 5;
    config.wacc_step = 0.03;
    config.growth_step = 0.02;
    SensitivityGrid grid = SensitivityGridGenerator(config).generate(bundle_, base_case_);

    SECTION("Cells with r <= g are NaN") {
        for (Eigen::Index i = 0; i < 5; ++i) {
            for (Eigen::Index j = 0; j < 5; ++j) {
                bool valid = model::TerminalValueCalculator::is_valid(grid.wacc_axis(i), grid.growth_axis(j));
                REQUIRE(grid.is_valid_cell(i, j) == valid);
                if (!valid) {
                    REQUIRE(std::isnan(grid.value_matrix(i, j)));
                }
            }
        }
        REQUIRE(grid.num_valid_cells() < 25);
        REQUIRE(grid.is_valid_cell(2, 2));
    }

    SECTION("Invalid cells serialise as null") {
        auto j = grid.to_json();
        // r = 0.03, g = 0.065
        REQUIRE(j["value_matrix"][0][4].is_null());
        REQUIRE(j["value_matrix"][2][2].is_number());
        REQUIRE(j["valid_cells"].get<int>() == grid.num_valid_cells());
    }

    SECTION("Invalid cells export as empty CSV fields") {
        auto path = (std::filesystem::temp_directory_path() / "dcf_test_grid.csv").string();
        grid.export_to_csv(path);

        std::ifstream in(path);
        std::string header;
        std::string first_row;
        std::getline(in, header);
        std::getline(in, first_row);

        REQUIRE(header.rfind("wacc\\growth", 0) == 0);
        REQUIRE(first_row.back() == ',');
        std::filesystem::remove(path);
    }

    SECTION("cell_value returns NaN for r <= g") {
        double v = SensitivityGridGenerator::cell_value(bundle_, base_case_.projected_cash_flows, 0.02, 0.03);
        REQUIRE(std::isnan(v));
    }
}

TEST_CASE_METHOD(SensitivityGridFixture, "Growth at or below -100% is invalid", "[SensitivityGrid]") {
    SensitivityConfig config;
    config.growth_step = 0.3;
    SensitivityGrid grid = SensitivityGridGenerator(config).generate(bundle_, base_case_);

    // g = 0.025 - 4 * 0.3 = -1.175
    REQUIRE(grid.growth_axis(0) < -1.0);
    for (Eigen::Index i = 0; i < 9; ++i) {
        REQUIRE_FALSE(grid.is_valid_cell(i, 0));
    }
    REQUIRE(grid.growth_axis(1) > -1.0);
    REQUIRE(grid.is_valid_cell(4, 1));
    REQUIRE(grid.value_matrix(4, 4) == base_case_.intrinsic_value_per_share);
}

TEST_CASE_METHOD(SensitivityGridFixture, "Large grids use a bounded number of tasks", "[SensitivityGrid]") {
    SECTION("Task count") {
        REQUIRE(SensitivityGridGenerator::task_count(1) == 1);
        REQUIRE(SensitivityGridGenerator::task_count(2001) >= 1);
        REQUIRE(static_cast<unsigned int>(SensitivityGridGenerator::task_count(2001)) <=
                std::max(1u, std::thread::hardware_concurrency()));
    }

    SECTION("Parallel and sequential agree on a large grid") {
        SensitivityConfig parallel;
        parallel.num_points = 101;
        parallel.wacc_step = 0.0005;
        parallel.growth_step = 0.0002;
        SensitivityConfig sequential = parallel;
        sequential.parallel = false;

        SensitivityGrid a = SensitivityGridGenerator(parallel).generate(bundle_, base_case_);
        SensitivityGrid b = SensitivityGridGenerator(sequential).generate(bundle_, base_case_);
        REQUIRE(a.num_valid_cells() == b.num_valid_cells());
        for (Eigen::Index i = 0; i < 101; ++i) {
            for (Eigen::Index j = 0; j < 101; ++j) {
                if (b.is_valid_cell(i, j)) {
                    REQUIRE(a.value_matrix(i, j) == b.value_matrix(i, j));
                }
            }
        }
    }
}

TEST_CASE("Grid generation failures", "[SensitivityGrid]") {
    auto bundle = testing::growth_company_bundle();
    scenario::ScenarioResult empty;
    empty.scenario_name = "base_case";
    REQUIRE_THROWS_AS(SensitivityGridGenerator().generate(bundle, empty), std::invalid_argument);
}
