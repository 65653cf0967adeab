#include "BinSetRegistry.hpp"
#include "Dataset.hpp"
#include "Errors.hpp"
#include "SpectralConfig.hpp"
#include "SpectralLoop.hpp"
#include "cli.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

int main(int argc, char *argv[])
{
    ckd::CLIConfig cli;
    if (!ckd::ParseCLI(argc, argv, cli))
    {
        return 1;
    }

    try
    {
        ckd::RunConfig cfg;
        if (fs::exists(cli.configPath))
        {
            cfg = ckd::RunConfig::LoadFromConfig(cli.configPath);
        }
        else
        {
            std::cout << "Config file " << cli.configPath
                      << " not found, using defaults." << std::endl;
        }

        if (!cli.dataRoot.empty())
        {
            cfg.data_root = cli.dataRoot;
        }
        if (!cli.binSet.empty())
        {
            cfg.spectral.bin_set = cli.binSet;
        }
        if (!cli.select.empty())
        {
            const YAML::Node select = YAML::Load(cli.select);
            if (!select.IsSequence())
            {
                throw ckd::ConfigError("--select expects a YAML sequence of bin selectors");
            }
            cfg.spectral.bins.clear();
            for (const auto &spec : select)
            {
                cfg.spectral.bins.push_back(spec);
            }
        }
        ckd::ConfigUnits().SetWavelength(cfg.wavelength_unit);

        auto store = std::make_shared<ckd::YamlDatasetStore>(cfg.data_root);
        ckd::BinSetRegistry registry(store, ckd::BinSetRegistry::kDefaultCapacity,
                                     cli.verbose);
        const auto ctx = ckd::CKDSpectralContext::Build(cfg.spectral, registry);

        std::cout << ctx.Summary() << std::endl;

        if (!cli.logPath.empty())
        {
            ctx.GetBinSet().WriteToFile(cli.logPath);
            std::cout << "Log written to: " << cli.logPath << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
