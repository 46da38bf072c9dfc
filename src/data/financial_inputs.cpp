/**
 * @file financial_inputs.cpp
 * @brief Implementation of FinancialInputBundle validation and JSON conversion
 */

#include "data/financial_inputs.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <sstream>
#include <vector>

namespace valuation
{

    namespace
    {
        // Value formatting for error messages
        std::string format_value(double value)
        {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        void require_finite(double value, const std::string &name)
        {
            if (!std::isfinite(value))
            {
                throw ValidationError("Parameter '" + name + "' must be finite, got: " + format_value(value));
            }
        }

        void require_non_negative(double value, const std::string &name)
        {
            require_finite(value, name);
            if (value < 0.0)
            {
                throw ValidationError("Expected non-negative value for parameter '" + name + "', got: " + format_value(value));
            }
        }

        void require_positive(double value, const std::string &name)
        {
            require_finite(value, name);
            if (value <= 0.0)
            {
                throw ValidationError("Expected positive value for parameter '" + name + "', got: " + format_value(value));
            }
        }

        void validate_series(const Eigen::VectorXd &series, const std::string &name, Eigen::Index expected_length)
        {
            if (series.size() < 3)
            {
                throw ValidationError("Historical series '" + name + "' must contain at least 3 years, got: " + std::to_string(series.size()));
            }

            if (series.size() != expected_length)
            {
                throw ValidationError("Historical series '" + name + "' has " + std::to_string(series.size()) +
                                      " entries but revenue_history has " + std::to_string(expected_length) +
                                      ". All historical series must be fiscally aligned");
            }

            if (!series.allFinite())
            {
                throw ValidationError("Historical series '" + name + "' contains NaN or Inf values");
            }
        }

        double required_number(const nlohmann::json &j, const std::string &key)
        {
            if (!j.contains(key))
            {
                throw ValidationError("Financial input bundle is missing required field '" + key + "'");
            }
            if (!j[key].is_number())
            {
                throw ValidationError("Field '" + key + "' must be a number");
            }
            return j[key].get<double>();
        }

        Eigen::VectorXd required_series(const nlohmann::json &j, const std::string &key)
        {
            if (!j.contains(key))
            {
                throw ValidationError("Financial input bundle is missing required field '" + key + "'");
            }

            const auto &node = j[key];
            if (!node.is_array())
            {
                throw ValidationError("Field '" + key + "' must be an array of numbers");
            }

            Eigen::VectorXd series(static_cast<Eigen::Index>(node.size()));
            for (size_t i = 0; i < node.size(); ++i)
            {
                if (!node[i].is_number())
                {
                    throw ValidationError("Field '" + key + "' has a non-numeric entry at index " + std::to_string(i));
                }
                series(static_cast<Eigen::Index>(i)) = node[i].get<double>();
            }
            return series;
        }

        std::vector<double> to_std_vector(const Eigen::VectorXd &v)
        {
            return std::vector<double>(v.data(), v.data() + v.size());
        }
    } // namespace

    Eigen::VectorXd FinancialInputBundle::historical_free_cash_flow() const
    {
        return operating_cash_flow_history - capex_history - working_capital_change_history;
    }

    void FinancialInputBundle::validate() const
    {
        if (identifier.empty())
        {
            throw ValidationError("Financial input bundle must specify an 'identifier'");
        }

        // Shape: every series aligned with revenue_history
        const Eigen::Index n_years = revenue_history.size();
        validate_series(revenue_history, "revenue_history", n_years);
        validate_series(operating_cash_flow_history, "operating_cash_flow_history", n_years);
        validate_series(capex_history, "capex_history", n_years);
        validate_series(working_capital_change_history, "working_capital_change_history", n_years);

        // Market quote and capital structure
        require_positive(current_price, "current_price");
        require_positive(shares_outstanding, "shares_outstanding");
        require_non_negative(market_cap, "market_cap");
        require_non_negative(total_debt, "total_debt");
        require_non_negative(cash_and_equivalents, "cash_and_equivalents");

        // Market-risk parameters
        require_finite(beta, "beta");
        require_finite(risk_free_rate, "risk_free_rate");
        require_finite(market_risk_premium, "market_risk_premium");
        require_finite(effective_tax_rate, "effective_tax_rate");

        if (effective_tax_rate < 0.0 || effective_tax_rate > 1.0)
        {
            throw ValidationError("Parameter 'effective_tax_rate' must lie in [0, 1], got: " + format_value(effective_tax_rate));
        }
    }

    FinancialInputBundle FinancialInputBundle::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw ValidationError("Financial input bundle must be a JSON object");
        }

        FinancialInputBundle bundle;

        if (!j.contains("identifier") || !j["identifier"].is_string())
        {
            throw ValidationError("Financial input bundle is missing required field 'identifier'");
        }
        bundle.identifier = j["identifier"].get<std::string>();

        bundle.current_price = required_number(j, "current_price");
        bundle.shares_outstanding = required_number(j, "shares_outstanding");
        bundle.market_cap = required_number(j, "market_cap");

        bundle.revenue_history = required_series(j, "revenue_history");
        bundle.operating_cash_flow_history = required_series(j, "operating_cash_flow_history");
        bundle.capex_history = required_series(j, "capex_history");
        bundle.working_capital_change_history = required_series(j, "working_capital_change_history");

        bundle.total_debt = required_number(j, "total_debt");
        bundle.cash_and_equivalents = required_number(j, "cash_and_equivalents");
        bundle.beta = required_number(j, "beta");
        bundle.risk_free_rate = required_number(j, "risk_free_rate");
        bundle.market_risk_premium = required_number(j, "market_risk_premium");
        bundle.effective_tax_rate = required_number(j, "effective_tax_rate");

        // Optional: bundles without a timestamp are treated as stale
        if (j.contains("last_updated"))
        {
            if (!j["last_updated"].is_string())
            {
                throw ValidationError("Field 'last_updated' must be an ISO-8601 string");
            }
            bundle.last_updated = parse_iso8601(j["last_updated"].get<std::string>());
        }

        return bundle;
    }

    nlohmann::json FinancialInputBundle::to_json() const
    {
        return nlohmann::json{
            {"identifier", identifier},
            {"current_price", current_price},
            {"shares_outstanding", shares_outstanding},
            {"market_cap", market_cap},
            {"revenue_history", to_std_vector(revenue_history)},
            {"operating_cash_flow_history", to_std_vector(operating_cash_flow_history)},
            {"capex_history", to_std_vector(capex_history)},
            {"working_capital_change_history", to_std_vector(working_capital_change_history)},
            {"total_debt", total_debt},
            {"cash_and_equivalents", cash_and_equivalents},
            {"beta", beta},
            {"risk_free_rate", risk_free_rate},
            {"market_risk_premium", market_risk_premium},
            {"effective_tax_rate", effective_tax_rate},
            {"last_updated", format_iso8601(last_updated)}};
    }

} // namespace valuation
