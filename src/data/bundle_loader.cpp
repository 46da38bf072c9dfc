/**
 * @file bundle_loader.cpp
 * @brief Implementation of BundleLoader
 */

#include "data/bundle_loader.hpp"
#include <fstream>
#include <stdexcept>

namespace valuation
{

    nlohmann::json BundleLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
        }

        return j;
    }

    FinancialInputBundle BundleLoader::load_bundle(const std::string &filepath)
    {
        FinancialInputBundle bundle = FinancialInputBundle::from_json(load_json(filepath));
        bundle.validate();
        return bundle;
    }

    engine::EngineConfig BundleLoader::load_config(const std::string &filepath)
    {
        engine::EngineConfig config = engine::EngineConfig::from_json(load_json(filepath));
        config.validate();
        return config;
    }

    scenario::ScenarioAssumptions BundleLoader::load_scenario(const std::string &filepath)
    {
        scenario::ScenarioAssumptions assumptions = scenario::ScenarioAssumptions::from_json(load_json(filepath));
        assumptions.validate();
        return assumptions;
    }

    void BundleLoader::save_json(const nlohmann::json &j, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << j.dump(2) << "\n";
    }

} // namespace valuation
