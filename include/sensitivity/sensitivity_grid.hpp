/**
 * @file sensitivity_grid.hpp
 * @brief Intrinsic value surface over discount rate x terminal growth
 *
 * The grid is centered on the base case's discount rate r0 and terminal
 * growth g0:
 *
 *     wacc_axis[i]   = r0 + (i - k) * wacc_step      (i = 0..n-1, k = (n-1)/2)
 *     growth_axis[j] = g0 + (j - k) * growth_step
 *     value[i][j]    = per-share value at (wacc_axis[i], growth_axis[j])
 *
 * Defaults: n = 9, wacc_step = 0.005, growth_step = 0.0025.
 *
 * Every cell reuses the base case's projected cash flows. Only the terminal
 * value and the discounting vary, so the grid measures discounting and
 * terminal-value sensitivity, not revenue-assumption sensitivity. Cells with
 * r <= g or g <= -1 are NaN; they never abort the grid. Parallel
 * generation splits the rows over at most hardware_concurrency() tasks.
 */

#pragma once

#include "data/financial_inputs.hpp"
#include "scenario/scenario_result.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace valuation
{
    namespace sensitivity
    {

        /**
         * @struct SensitivityConfig
         * @brief Grid shape
         */
        struct SensitivityConfig
        {
            int num_points = 9;          ///< Points per axis (odd, >= 3)
            double wacc_step = 0.005;    ///< Discount rate step
            double growth_step = 0.0025; ///< Terminal growth step
            bool parallel = true;        ///< Compute rows concurrently

            /**
             * @brief Validate grid shape
             * @throws std::invalid_argument if num_points is even or < 3, or a step is not positive
             */
            void validate() const;

            static SensitivityConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct SensitivityGrid
         * @brief Discount rate x terminal growth value matrix
         */
        struct SensitivityGrid
        {
            Eigen::VectorXd wacc_axis;        ///< Discount rates (rows)
            Eigen::VectorXd growth_axis;      ///< Terminal growth rates (columns)
            Eigen::MatrixXd value_matrix;     ///< Per-share value, NaN for invalid cells
            double base_case_value = 0.0;     ///< Center cell

            /**
             * @brief Check whether a cell holds a value
             */
            bool is_valid_cell(Eigen::Index i, Eigen::Index j) const;

            /**
             * @brief Number of cells that hold a value
             */
            int num_valid_cells() const;

            /**
             * @brief Smallest valid cell value (NaN if no valid cell)
             */
            double min_value() const;

            /**
             * @brief Largest valid cell value (NaN if no valid cell)
             */
            double max_value() const;

            /**
             * @brief Row/column index of the center cell
             */
            Eigen::Index center_index() const { return (wacc_axis.size() - 1) / 2; }

            /**
             * @brief Convert to JSON (invalid cells as null)
             */
            nlohmann::json to_json() const;

            /**
             * @brief Export matrix to CSV
             * @param filepath Output path
             * @throws std::runtime_error if the file cannot be opened
             *
             * Header row holds the growth axis; each row starts with its
             * discount rate. Invalid cells are empty fields.
             */
            void export_to_csv(const std::string &filepath) const;

            void print_summary() const;
        };

        /**
         * @class SensitivityGridGenerator
         * @brief Builds a SensitivityGrid around a base-case ScenarioResult
         *
         * Usage Example:
         * @code
         * SensitivityGridGenerator generator;
         * auto grid = generator.generate(bundle, base_case_result);
         * grid.export_to_csv("sensitivity_grid.csv");
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SensitivityGridGenerator
        {
        public:
            SensitivityGridGenerator();

            /**
             * @brief Construct generator
             * @throws std::invalid_argument if config is invalid
             */
            explicit SensitivityGridGenerator(const SensitivityConfig &config);

            /**
             * @brief Build the grid
             * @param bundle Validated financial inputs (debt, cash, shares)
             * @param base_case Base-case result whose cash flows are reused
             * @return SensitivityGrid
             * @throws std::invalid_argument if base_case has no projected cash flows
             */
            SensitivityGrid generate(const FinancialInputBundle &bundle,
                                     const scenario::ScenarioResult &base_case) const;

            /**
             * @brief Per-share value for one (r, g) pair
             * @return Value, or NaN if r <= g or g <= -1
             */
            static double cell_value(const FinancialInputBundle &bundle,
                                     const Eigen::VectorXd &cash_flows,
                                     double discount_rate,
                                     double terminal_growth_rate);

            /**
             * @brief Evenly spaced axis centered on a value
             */
            static Eigen::VectorXd build_axis(double center, double step, int num_points);

            /**
             * @brief Number of parallel tasks used for a grid with the given rows
             * @return Between 1 and min(rows, hardware threads)
             */
            static int task_count(Eigen::Index rows);

            const SensitivityConfig &config() const { return config_; }

        private:
            SensitivityConfig config_;

            void fill_row(const FinancialInputBundle &bundle,
                          const Eigen::VectorXd &cash_flows,
                          SensitivityGrid &grid,
                          Eigen::Index row) const;
        };

    } // namespace sensitivity
} // namespace valuation
