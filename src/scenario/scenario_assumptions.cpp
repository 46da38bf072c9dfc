/**
 * @file scenario_assumptions.cpp
 * @brief Implementation of scenario assumptions and the scenario table
 */

#include "scenario/scenario_assumptions.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace valuation
{
    namespace scenario
    {

        namespace
        {
            std::string format_rate(double value)
            {
                std::ostringstream oss;
                oss << value;
                return oss.str();
            }

            double required_number(const nlohmann::json &j, const std::string &key, const std::string &scenario_name)
            {
                if (!j.contains(key))
                {
                    throw ValidationError("Scenario '" + scenario_name + "' is missing required field '" + key + "'");
                }
                if (!j[key].is_number())
                {
                    throw ValidationError("Scenario '" + scenario_name + "': field '" + key + "' must be a number");
                }
                return j[key].get<double>();
            }

            ScenarioAssumptions make_entry(const std::string &name,
                                           double growth,
                                           double margin_factor,
                                           double offset,
                                           double terminal_growth,
                                           double confidence)
            {
                ScenarioAssumptions a;
                a.scenario_name = name;
                a.revenue_growth_rate = growth;
                a.margin_adjustment_factor = margin_factor;
                a.discount_rate_offset = offset;
                a.terminal_growth_rate = terminal_growth;
                a.confidence_level = confidence;
                a.projection_horizon_years = 5;
                return a;
            }

            // Table entries override defaults field by field
            ScenarioAssumptions merge_entry(const ScenarioAssumptions &defaults, const nlohmann::json &j)
            {
                if (!j.is_object())
                {
                    throw ValidationError("Scenario table entry '" + defaults.scenario_name + "' must be a JSON object");
                }

                ScenarioAssumptions a = defaults;
                try
                {
                    a.revenue_growth_rate = j.value("revenue_growth_rate", a.revenue_growth_rate);
                    a.margin_adjustment_factor = j.value("margin_adjustment_factor", a.margin_adjustment_factor);
                    a.discount_rate_offset = j.value("discount_rate_offset", a.discount_rate_offset);
                    a.terminal_growth_rate = j.value("terminal_growth_rate", a.terminal_growth_rate);
                    a.confidence_level = j.value("confidence_level", a.confidence_level);
                    a.projection_horizon_years = j.value("projection_horizon_years", a.projection_horizon_years);
                }
                catch (const nlohmann::json::exception &e)
                {
                    throw ValidationError("Scenario table entry '" + defaults.scenario_name + "' is malformed: " + e.what());
                }
                return a;
            }
        } // namespace

        std::string to_string(ScenarioType type)
        {
            switch (type)
            {
            case ScenarioType::WORST_CASE:
                return "worst_case";
            case ScenarioType::BASE_CASE:
                return "base_case";
            case ScenarioType::BEST_CASE:
                return "best_case";
            case ScenarioType::CUSTOM:
                return "custom";
            }
            return "custom";
        }

        const std::vector<ScenarioType> &canonical_scenarios()
        {
            static const std::vector<ScenarioType> types = {
                ScenarioType::WORST_CASE,
                ScenarioType::BASE_CASE,
                ScenarioType::BEST_CASE};
            return types;
        }

        // ============================================================================
        // ScenarioAssumptions Implementation
        // ============================================================================

        void ScenarioAssumptions::validate() const
        {
            if (scenario_name.empty())
            {
                throw ValidationError("Scenario assumptions must specify a 'scenario_name'");
            }

            const std::string prefix = "Scenario '" + scenario_name + "': ";

            if (!std::isfinite(revenue_growth_rate) || revenue_growth_rate <= -1.0)
            {
                throw ValidationError(prefix + "revenue_growth_rate must be finite and greater than -1, got: " + format_rate(revenue_growth_rate));
            }

            if (!std::isfinite(margin_adjustment_factor) || margin_adjustment_factor < 0.0)
            {
                throw ValidationError(prefix + "margin_adjustment_factor must be finite and non-negative, got: " + format_rate(margin_adjustment_factor));
            }

            if (!std::isfinite(discount_rate) || discount_rate <= -1.0)
            {
                throw ValidationError(prefix + "discount_rate must be finite and greater than -1, got: " + format_rate(discount_rate));
            }

            if (!std::isfinite(discount_rate_offset))
            {
                throw ValidationError(prefix + "discount_rate_offset must be finite");
            }

            if (!std::isfinite(terminal_growth_rate) || terminal_growth_rate <= -1.0)
            {
                throw ValidationError(prefix + "terminal_growth_rate must be finite and greater than -1, got: " + format_rate(terminal_growth_rate));
            }

            if (!std::isfinite(confidence_level) || confidence_level < 0.0 || confidence_level > 1.0)
            {
                throw ValidationError(prefix + "confidence_level must lie in [0, 1], got: " + format_rate(confidence_level));
            }

            if (projection_horizon_years < 1)
            {
                throw ValidationError(prefix + "projection_horizon_years must be at least 1, got: " + std::to_string(projection_horizon_years));
            }
        }

        void ScenarioAssumptions::require_discount_above_growth() const
        {
            if (!(discount_rate > terminal_growth_rate))
            {
                throw DomainError(
                    "Scenario '" + scenario_name + "': discount rate (" + format_rate(discount_rate) +
                    ") must exceed terminal growth rate (" + format_rate(terminal_growth_rate) +
                    ") for the Gordon growth model");
            }
        }

        ScenarioAssumptions ScenarioAssumptions::with_discount_rate(double rate) const
        {
            ScenarioAssumptions copy = *this;
            copy.discount_rate = rate;
            return copy;
        }

        ScenarioAssumptions ScenarioAssumptions::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ValidationError("Scenario assumptions must be a JSON object");
            }

            ScenarioAssumptions a;

            if (j.contains("scenario_name"))
            {
                if (!j["scenario_name"].is_string())
                {
                    throw ValidationError("Field 'scenario_name' must be a string");
                }
                a.scenario_name = j["scenario_name"].get<std::string>();
            }

            a.revenue_growth_rate = required_number(j, "revenue_growth_rate", a.scenario_name);
            a.margin_adjustment_factor = required_number(j, "margin_adjustment_factor", a.scenario_name);
            a.discount_rate = required_number(j, "discount_rate", a.scenario_name);
            a.terminal_growth_rate = required_number(j, "terminal_growth_rate", a.scenario_name);

            if (j.contains("confidence_level"))
            {
                a.confidence_level = required_number(j, "confidence_level", a.scenario_name);
            }

            if (j.contains("projection_horizon_years"))
            {
                if (!j["projection_horizon_years"].is_number_integer())
                {
                    throw ValidationError("Scenario '" + a.scenario_name + "': field 'projection_horizon_years' must be an integer");
                }
                a.projection_horizon_years = j["projection_horizon_years"].get<int>();
            }

            return a;
        }

        nlohmann::json ScenarioAssumptions::to_json() const
        {
            return nlohmann::json{
                {"scenario_name", scenario_name},
                {"revenue_growth_rate", revenue_growth_rate},
                {"margin_adjustment_factor", margin_adjustment_factor},
                {"discount_rate", discount_rate},
                {"discount_rate_offset", discount_rate_offset},
                {"terminal_growth_rate", terminal_growth_rate},
                {"confidence_level", confidence_level},
                {"projection_horizon_years", projection_horizon_years}};
        }

        // ============================================================================
        // ScenarioTable Implementation
        // ============================================================================

        const ScenarioAssumptions &ScenarioTable::get(ScenarioType type) const
        {
            switch (type)
            {
            case ScenarioType::WORST_CASE:
                return worst_case;
            case ScenarioType::BASE_CASE:
                return base_case;
            case ScenarioType::BEST_CASE:
                return best_case;
            default:
                throw std::invalid_argument("Scenario table holds only canonical scenarios, not 'custom'");
            }
        }

        ScenarioTable ScenarioTable::defaults()
        {
            ScenarioTable table;
            table.worst_case = make_entry("worst_case", 0.02, 0.85, 0.02, 0.020, 0.25);
            table.base_case = make_entry("base_case", 0.05, 1.00, 0.00, 0.025, 0.50);
            table.best_case = make_entry("best_case", 0.08, 1.15, -0.01, 0.030, 0.25);
            return table;
        }

        void ScenarioTable::validate() const
        {
            for (ScenarioType type : canonical_scenarios())
            {
                get(type).validate();
            }
        }

        ScenarioTable ScenarioTable::from_json(const nlohmann::json &j)
        {
            ScenarioTable table = defaults();

            if (!j.is_object())
            {
                throw ValidationError("Scenario table must be a JSON object");
            }

            if (j.contains("worst_case"))
            {
                table.worst_case = merge_entry(table.worst_case, j["worst_case"]);
            }
            if (j.contains("base_case"))
            {
                table.base_case = merge_entry(table.base_case, j["base_case"]);
            }
            if (j.contains("best_case"))
            {
                table.best_case = merge_entry(table.best_case, j["best_case"]);
            }

            return table;
        }

        nlohmann::json ScenarioTable::to_json() const
        {
            nlohmann::json j;
            for (ScenarioType type : canonical_scenarios())
            {
                nlohmann::json entry = get(type).to_json();
                entry.erase("discount_rate");
                j[to_string(type)] = entry;
            }
            return j;
        }

    } // namespace scenario
} // namespace valuation
