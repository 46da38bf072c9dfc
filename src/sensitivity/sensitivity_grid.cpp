/**
 * @file sensitivity_grid.cpp
 * @brief Implementation of the discount rate x terminal growth sensitivity grid
 */

#include "sensitivity/sensitivity_grid.hpp"
#include "model/present_value.hpp"
#include "model/terminal_value.hpp"
#include "scenario/scenario_runner.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

namespace valuation
{
    namespace sensitivity
    {

        // ============================================================================
        // SensitivityConfig Implementation
        // ============================================================================

        void SensitivityConfig::validate() const
        {
            if (num_points < 3 || num_points % 2 == 0)
            {
                throw std::invalid_argument(
                    "Sensitivity grid needs an odd number of points (>= 3) per axis, got: " +
                    std::to_string(num_points));
            }

            if (!(wacc_step > 0.0) || !std::isfinite(wacc_step))
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'wacc_step', got: " + std::to_string(wacc_step));
            }

            if (!(growth_step > 0.0) || !std::isfinite(growth_step))
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'growth_step', got: " + std::to_string(growth_step));
            }
        }

        SensitivityConfig SensitivityConfig::from_json(const nlohmann::json &j)
        {
            SensitivityConfig config;
            if (j.is_object())
            {
                config.num_points = j.value("num_points", config.num_points);
                config.wacc_step = j.value("wacc_step", config.wacc_step);
                config.growth_step = j.value("growth_step", config.growth_step);
                config.parallel = j.value("parallel", config.parallel);
            }
            return config;
        }

        nlohmann::json SensitivityConfig::to_json() const
        {
            return nlohmann::json{
                {"num_points", num_points},
                {"wacc_step", wacc_step},
                {"growth_step", growth_step},
                {"parallel", parallel}};
        }

        // ============================================================================
        // SensitivityGrid Implementation
        // ============================================================================

        bool SensitivityGrid::is_valid_cell(Eigen::Index i, Eigen::Index j) const
        {
            return std::isfinite(value_matrix(i, j));
        }

        int SensitivityGrid::num_valid_cells() const
        {
            int count = 0;
            for (Eigen::Index i = 0; i < value_matrix.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < value_matrix.cols(); ++j)
                {
                    if (is_valid_cell(i, j))
                    {
                        ++count;
                    }
                }
            }
            return count;
        }

        double SensitivityGrid::min_value() const
        {
            double result = std::numeric_limits<double>::quiet_NaN();
            for (Eigen::Index i = 0; i < value_matrix.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < value_matrix.cols(); ++j)
                {
                    if (is_valid_cell(i, j) && (std::isnan(result) || value_matrix(i, j) < result))
                    {
                        result = value_matrix(i, j);
                    }
                }
            }
            return result;
        }

        double SensitivityGrid::max_value() const
        {
            double result = std::numeric_limits<double>::quiet_NaN();
            for (Eigen::Index i = 0; i < value_matrix.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < value_matrix.cols(); ++j)
                {
                    if (is_valid_cell(i, j) && (std::isnan(result) || value_matrix(i, j) > result))
                    {
                        result = value_matrix(i, j);
                    }
                }
            }
            return result;
        }

        nlohmann::json SensitivityGrid::to_json() const
        {
            nlohmann::json j;
            j["wacc_axis"] = std::vector<double>(wacc_axis.data(), wacc_axis.data() + wacc_axis.size());
            j["growth_axis"] = std::vector<double>(growth_axis.data(), growth_axis.data() + growth_axis.size());

            nlohmann::json matrix = nlohmann::json::array();
            for (Eigen::Index i = 0; i < value_matrix.rows(); ++i)
            {
                nlohmann::json row = nlohmann::json::array();
                for (Eigen::Index c = 0; c < value_matrix.cols(); ++c)
                {
                    if (is_valid_cell(i, c))
                    {
                        row.push_back(value_matrix(i, c));
                    }
                    else
                    {
                        row.push_back(nullptr);
                    }
                }
                matrix.push_back(row);
            }
            j["value_matrix"] = matrix;
            j["base_case_value"] = base_case_value;
            j["valid_cells"] = num_valid_cells();
            return j;
        }

        void SensitivityGrid::export_to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << std::fixed << std::setprecision(6);

            // Header: growth axis
            file << "wacc\\growth";
            for (Eigen::Index j = 0; j < growth_axis.size(); ++j)
            {
                file << "," << growth_axis(j);
            }
            file << "\n";

            for (Eigen::Index i = 0; i < wacc_axis.size(); ++i)
            {
                file << wacc_axis(i);
                for (Eigen::Index j = 0; j < growth_axis.size(); ++j)
                {
                    file << ",";
                    if (is_valid_cell(i, j))
                    {
                        file << value_matrix(i, j);
                    }
                }
                file << "\n";
            }

            file.close();
        }

        void SensitivityGrid::print_summary() const
        {
            std::cout << "\n=== Sensitivity Grid (value per share) ===\n";
            std::cout << std::setw(10) << "WACC\\g";
            for (Eigen::Index j = 0; j < growth_axis.size(); ++j)
            {
                std::cout << std::setw(10) << std::fixed << std::setprecision(2)
                          << growth_axis(j) * 100 << "%";
            }
            std::cout << "\n";

            for (Eigen::Index i = 0; i < wacc_axis.size(); ++i)
            {
                std::cout << std::setw(9) << std::fixed << std::setprecision(2)
                          << wacc_axis(i) * 100 << "%";
                for (Eigen::Index j = 0; j < growth_axis.size(); ++j)
                {
                    if (is_valid_cell(i, j))
                    {
                        std::cout << std::setw(11) << value_matrix(i, j);
                    }
                    else
                    {
                        std::cout << std::setw(11) << "n/a";
                    }
                }
                std::cout << "\n";
            }

            std::cout << "Valid cells: " << num_valid_cells() << "/"
                      << value_matrix.rows() * value_matrix.cols() << "\n";
            std::cout << "Base case value: " << std::setprecision(2) << base_case_value << "\n";
            std::cout << "==========================================\n"
                      << std::endl;
        }

        // ============================================================================
        // SensitivityGridGenerator Implementation
        // ============================================================================

        SensitivityGridGenerator::SensitivityGridGenerator()
            : config_()
        {
        }

        SensitivityGridGenerator::SensitivityGridGenerator(const SensitivityConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        Eigen::VectorXd SensitivityGridGenerator::build_axis(double center, double step, int num_points)
        {
            const int half = (num_points - 1) / 2;
            Eigen::VectorXd axis(num_points);
            for (int k = 0; k < num_points; ++k)
            {
                // k == half yields center exactly
                axis(k) = center + static_cast<double>(k - half) * step;
            }
            return axis;
        }

        int SensitivityGridGenerator::task_count(Eigen::Index rows)
        {
            const unsigned int hardware = std::thread::hardware_concurrency();
            const Eigen::Index limit = hardware > 0 ? static_cast<Eigen::Index>(hardware) : 1;
            return static_cast<int>(std::max<Eigen::Index>(1, std::min(rows, limit)));
        }

        double SensitivityGridGenerator::cell_value(const FinancialInputBundle &bundle,
                                                    const Eigen::VectorXd &cash_flows,
                                                    double discount_rate,
                                                    double terminal_growth_rate)
        {
            if (!model::TerminalValueCalculator::is_valid(discount_rate, terminal_growth_rate) ||
                discount_rate <= -1.0)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            model::DiscountedValuation discounted = model::PresentValueDiscounter::value(
                cash_flows, discount_rate, terminal_growth_rate);

            return scenario::ScenarioRunner::value_per_share(discounted.enterprise_value, bundle);
        }

        void SensitivityGridGenerator::fill_row(const FinancialInputBundle &bundle,
                                                const Eigen::VectorXd &cash_flows,
                                                SensitivityGrid &grid,
                                                Eigen::Index row) const
        {
            const double discount_rate = grid.wacc_axis(row);
            for (Eigen::Index col = 0; col < grid.growth_axis.size(); ++col)
            {
                grid.value_matrix(row, col) = cell_value(bundle, cash_flows, discount_rate, grid.growth_axis(col));
            }
        }

        SensitivityGrid SensitivityGridGenerator::generate(const FinancialInputBundle &bundle,
                                                           const scenario::ScenarioResult &base_case) const
        {
            if (base_case.projected_cash_flows.size() == 0)
            {
                throw std::invalid_argument(
                    "Base case '" + base_case.scenario_name + "' has no projected cash flows");
            }

            SensitivityGrid grid;
            grid.wacc_axis = build_axis(base_case.discount_rate, config_.wacc_step, config_.num_points);
            grid.growth_axis = build_axis(base_case.terminal_growth_rate, config_.growth_step, config_.num_points);
            grid.value_matrix = Eigen::MatrixXd::Constant(
                config_.num_points, config_.num_points, std::numeric_limits<double>::quiet_NaN());

            const Eigen::VectorXd &cash_flows = base_case.projected_cash_flows;

            if (config_.parallel)
            {
                // Task t fills rows t, t + n, t + 2n, ...; rows write disjoint parts of the matrix
                const Eigen::Index num_rows = grid.wacc_axis.size();
                const int num_tasks = task_count(num_rows);
                std::vector<std::future<void>> tasks;
                tasks.reserve(num_tasks);
                for (int t = 0; t < num_tasks; ++t)
                {
                    tasks.push_back(std::async(std::launch::async,
                                               [this, &bundle, &cash_flows, &grid, num_rows, num_tasks, t]()
                                               {
                                                   for (Eigen::Index row = t; row < num_rows; row += num_tasks)
                                                   {
                                                       fill_row(bundle, cash_flows, grid, row);
                                                   }
                                               }));
                }
                for (auto &task : tasks)
                {
                    task.get();
                }
            }
            else
            {
                for (Eigen::Index row = 0; row < grid.wacc_axis.size(); ++row)
                {
                    fill_row(bundle, cash_flows, grid, row);
                }
            }

            const Eigen::Index center = grid.center_index();
            grid.base_case_value = grid.value_matrix(center, center);

            return grid;
        }

    } // namespace sensitivity
} // namespace valuation
