// CKD spectral configuration loaded from YAML.
#pragma once

#include "Units.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace ckd
{
/// Bin set id plus the bin selection specs of a run. An empty selection
/// means every bin of the bin set.
struct CKDSpectralConfig
{
    std::string bin_set = "10nm";
    std::vector<YAML::Node> bins;

    /// Parse a `spectral` block. Throws ConfigError on malformed values.
    static CKDSpectralConfig FromNode(const YAML::Node &node);
};

/// Run-level options read from config/config.yaml.
struct RunConfig
{
    /// Root directory of the YAML dataset store.
    std::string data_root = "data";
    /// Unit used for bare wavelength magnitudes.
    LengthUnit wavelength_unit = LengthUnit::Nanometer;
    CKDSpectralConfig spectral;

    /// Load from a YAML config file; missing blocks keep their defaults.
    /// Throws std::runtime_error if the file cannot be opened and ConfigError
    /// on invalid values.
    static RunConfig LoadFromConfig(const std::string &config_path);

    static RunConfig FromNode(const YAML::Node &root);
};
}  // namespace ckd
