#pragma once

#include <mfem.hpp>

#include <iostream>
#include <string>

namespace ckd
{
struct CLIConfig
{
    std::string configPath{"config/config.yaml"};
    // Empty strings keep the values read from the config file.
    std::string dataRoot;
    std::string binSet;
    // YAML sequence of bin selectors, e.g. "['550', [interval, {wmin: 500, wmax: 600}]]"
    std::string select;
    std::string logPath;
    bool verbose{false};
};

inline bool ParseCLI(int argc, char **argv, CLIConfig &cfg)
{
    mfem::OptionsParser p(argc, argv);
    p.AddOption(&cfg.configPath, "-c", "--config", "Path to config YAML.");
    p.AddOption(&cfg.dataRoot, "-d", "--data-root",
                "Dataset store root directory. Empty uses config.");
    p.AddOption(&cfg.binSet, "-b", "--bin-set", "Bin set id. Empty uses config.");
    p.AddOption(&cfg.select, "-s", "--select",
                "Bin selectors as a YAML sequence. Empty uses config.");
    p.AddOption(&cfg.logPath, "-l", "--log",
                "Write the bin set summary to this file.");
    p.AddOption(&cfg.verbose, "-v", "--verbose", "-q", "--quiet",
                "Report dataset loads.");
    p.Parse();
    if (!p.Good())
    {
        p.PrintUsage(std::cout);
        return false;
    }
    p.PrintOptions(std::cout);
    return true;
}
}  // namespace ckd
