/**
 * @file engine_config.cpp
 * @brief Implementation of EngineConfig parsing and validation
 */

#include "engine/engine_config.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace valuation
{
    namespace engine
    {

        void EngineConfig::validate() const
        {
            if (!std::isfinite(debt_spread) || debt_spread < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'debt_spread', got: " + std::to_string(debt_spread));
            }

            if (!std::isfinite(historical_growth_weight) || historical_growth_weight < 0.0 || historical_growth_weight > 1.0)
            {
                throw std::invalid_argument(
                    "Expected value in [0, 1] for parameter 'historical_growth_weight', got: " +
                    std::to_string(historical_growth_weight));
            }

            if (!std::isfinite(growth_decay_factor) || growth_decay_factor <= 0.0 || growth_decay_factor > 1.0)
            {
                throw std::invalid_argument(
                    "Expected value in (0, 1] for parameter 'growth_decay_factor', got: " +
                    std::to_string(growth_decay_factor));
            }

            if (fcf_lookback_years < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'fcf_lookback_years', got: " +
                    std::to_string(fcf_lookback_years));
            }

            if (!std::isfinite(quality_warning_threshold) || quality_warning_threshold < 0.0 || quality_warning_threshold > 1.0)
            {
                throw std::invalid_argument(
                    "Expected value in [0, 1] for parameter 'quality_warning_threshold', got: " +
                    std::to_string(quality_warning_threshold));
            }

            sensitivity.validate();
            scenarios.validate();
        }

        EngineConfig EngineConfig::from_json(const nlohmann::json &doc)
        {
            EngineConfig config;

            const nlohmann::json &j = doc.contains("engine") ? doc["engine"] : doc;
            if (!j.is_object())
            {
                throw ValidationError("Engine configuration must be a JSON object");
            }

            try
            {
                config.debt_spread = j.value("debt_spread", config.debt_spread);
                config.historical_growth_weight = j.value("historical_growth_weight", config.historical_growth_weight);
                config.growth_decay_factor = j.value("growth_decay_factor", config.growth_decay_factor);
                config.fcf_lookback_years = j.value("fcf_lookback_years", config.fcf_lookback_years);
                config.quality_warning_threshold = j.value("quality_warning_threshold", config.quality_warning_threshold);
                config.parallel_scenarios = j.value("parallel_scenarios", config.parallel_scenarios);
                config.verbose = j.value("verbose", config.verbose);

                if (j.contains("sensitivity"))
                {
                    config.sensitivity = sensitivity::SensitivityConfig::from_json(j["sensitivity"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ValidationError(std::string("Malformed engine configuration: ") + e.what());
            }

            if (j.contains("scenarios"))
            {
                config.scenarios = scenario::ScenarioTable::from_json(j["scenarios"]);
            }

            return config;
        }

        nlohmann::json EngineConfig::to_json() const
        {
            return nlohmann::json{
                {"engine",
                 {{"debt_spread", debt_spread},
                  {"historical_growth_weight", historical_growth_weight},
                  {"growth_decay_factor", growth_decay_factor},
                  {"fcf_lookback_years", fcf_lookback_years},
                  {"quality_warning_threshold", quality_warning_threshold},
                  {"parallel_scenarios", parallel_scenarios},
                  {"verbose", verbose},
                  {"sensitivity", sensitivity.to_json()},
                  {"scenarios", scenarios.to_json()}}}};
        }

    } // namespace engine
} // namespace valuation
