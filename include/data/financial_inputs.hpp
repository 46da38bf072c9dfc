/**
 * @file financial_inputs.hpp
 * @brief Financial input bundle consumed by the valuation engine
 *
 * A FinancialInputBundle holds everything one valuation request needs:
 * market quote, capital structure, market-risk parameters and aligned
 * historical series from the cash flow statement. The bundle is supplied
 * by the data layer; the engine only checks its shape and domain.
 */

#ifndef VALUATION_DATA_FINANCIAL_INPUTS_HPP
#define VALUATION_DATA_FINANCIAL_INPUTS_HPP

#include "common/timestamp.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace valuation
{

    /**
     * @struct FinancialInputBundle
     * @brief Immutable input for a single valuation request
     *
     * Historical series are chronological (oldest first) and share the same
     * fiscal alignment: index i of every series refers to the same year.
     *
     * Required invariants (checked by validate()):
     * - all four historical series have identical length >= 3
     * - shares_outstanding > 0 and current_price > 0
     * - market_cap, total_debt and cash_and_equivalents are non-negative
     * - effective_tax_rate lies in [0, 1]
     */
    struct FinancialInputBundle
    {
        std::string identifier;                        ///< Ticker symbol
        double current_price = 0.0;                    ///< Current market price per share
        double shares_outstanding = 0.0;               ///< Diluted shares outstanding
        double market_cap = 0.0;                       ///< Market capitalization

        Eigen::VectorXd revenue_history;               ///< Annual revenue
        Eigen::VectorXd operating_cash_flow_history;   ///< Cash flow from operations
        Eigen::VectorXd capex_history;                 ///< Capital expenditures (positive outflow)
        Eigen::VectorXd working_capital_change_history; ///< Increase in net working capital

        double total_debt = 0.0;                       ///< Total interest-bearing debt
        double cash_and_equivalents = 0.0;             ///< Cash and short-term investments

        double beta = 1.0;                             ///< Equity beta
        double risk_free_rate = 0.0;                   ///< Risk-free rate (fraction)
        double market_risk_premium = 0.0;              ///< Equity market risk premium (fraction)
        double effective_tax_rate = 0.0;               ///< Effective tax rate (fraction)

        Timestamp last_updated{};                      ///< When the data layer produced the bundle

        /**
         * @brief Number of historical fiscal years
         */
        Eigen::Index num_years() const { return revenue_history.size(); }

        /**
         * @brief Historical free cash flow per year (OCF - capex - change in working capital)
         * @return Vector aligned with the historical series
         */
        Eigen::VectorXd historical_free_cash_flow() const;

        /**
         * @brief Check shape and domain constraints
         * @throws ValidationError describing the first violated constraint
         */
        void validate() const;

        /**
         * @brief Create bundle from JSON
         * @param j JSON object with the bundle fields
         * @return Parsed bundle (not yet validated)
         * @throws ValidationError if a required field is missing or has the wrong type
         *
         * Example JSON:
         * @code{.json}
         * {
         *   "identifier": "ACME",
         *   "current_price": 100.0,
         *   "shares_outstanding": 1000000,
         *   "market_cap": 100000000,
         *   "revenue_history": [1000, 1100, 1200],
         *   "operating_cash_flow_history": [200, 220, 240],
         *   "capex_history": [50, 55, 60],
         *   "working_capital_change_history": [10, 12, 14],
         *   "total_debt": 500000,
         *   "cash_and_equivalents": 100000,
         *   "beta": 1.2,
         *   "risk_free_rate": 0.03,
         *   "market_risk_premium": 0.06,
         *   "effective_tax_rate": 0.25,
         *   "last_updated": "2024-03-31T16:00:00Z"
         * }
         * @endcode
         */
        static FinancialInputBundle from_json(const nlohmann::json &j);

        /**
         * @brief Convert bundle to JSON
         */
        nlohmann::json to_json() const;
    };

} // namespace valuation

#endif // VALUATION_DATA_FINANCIAL_INPUTS_HPP
