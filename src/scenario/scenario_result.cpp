/**
 * @file scenario_result.cpp
 * @brief Implementation of ScenarioResult reporting helpers
 */

#include "scenario/scenario_result.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

namespace valuation
{
    namespace scenario
    {

        namespace
        {
            std::vector<double> to_std_vector(const Eigen::VectorXd &v)
            {
                return std::vector<double>(v.data(), v.data() + v.size());
            }
        } // namespace

        double ScenarioResult::discounted_terminal_value() const
        {
            if (present_values.size() == 0)
            {
                return 0.0;
            }
            return present_values(present_values.size() - 1);
        }

        double ScenarioResult::terminal_value_share() const
        {
            if (total_enterprise_value == 0.0)
            {
                return 0.0;
            }
            return discounted_terminal_value() / total_enterprise_value;
        }

        nlohmann::json ScenarioResult::to_json() const
        {
            nlohmann::json j;
            j["scenario_name"] = scenario_name;
            j["intrinsic_value_per_share"] = intrinsic_value_per_share;
            j["total_enterprise_value"] = total_enterprise_value;
            j["equity_value"] = equity_value;
            j["terminal_value"] = terminal_value;
            j["fcf_margin"] = fcf_margin;
            j["projected_revenues"] = to_std_vector(projected_revenues);
            j["projected_cash_flows"] = to_std_vector(projected_cash_flows);
            j["present_values"] = to_std_vector(present_values);
            j["discount_rate"] = discount_rate;
            j["terminal_growth_rate"] = terminal_growth_rate;
            j["upside_downside_percentage"] = upside_downside_percentage;
            j["assumptions"] = assumptions.to_json();
            return j;
        }

        void ScenarioResult::print_summary() const
        {
            std::cout << "\n"
                      << scenario_name << "\n";
            std::cout << std::string(60, '-') << "\n";

            std::cout << "  Discount Rate:        " << std::fixed << std::setprecision(2)
                      << discount_rate * 100 << "%\n";
            std::cout << "  Terminal Growth:      " << terminal_growth_rate * 100 << "%\n";
            std::cout << "  FCF Margin (hist.):   " << fcf_margin * 100 << "%\n";
            std::cout << "  Enterprise Value:     " << total_enterprise_value << "\n";
            std::cout << "  Terminal Value:       " << terminal_value
                      << " (" << terminal_value_share() * 100 << "% of EV discounted)\n";
            std::cout << "  Equity Value:         " << equity_value << "\n";
            std::cout << "  Intrinsic Value/Share: " << intrinsic_value_per_share << "\n";
            std::cout << "  Upside/Downside:      " << std::showpos
                      << upside_downside_percentage << "%" << std::noshowpos << "\n";

            std::cout << "\n  Year  " << std::setw(16) << "Revenue"
                      << std::setw(16) << "FCF"
                      << std::setw(16) << "PV" << "\n";
            for (Eigen::Index i = 0; i < projected_cash_flows.size(); ++i)
            {
                std::cout << "  " << std::setw(4) << (i + 1) << "  "
                          << std::setw(16) << projected_revenues(i)
                          << std::setw(16) << projected_cash_flows(i)
                          << std::setw(16) << present_values(i) << "\n";
            }
            std::cout << "  TV    " << std::setw(32) << ""
                      << std::setw(16) << discounted_terminal_value() << "\n";

            std::cout << std::string(60, '-') << "\n";
        }

    } // namespace scenario
} // namespace valuation
