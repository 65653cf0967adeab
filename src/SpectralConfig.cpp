// CKD spectral configuration loaded from YAML.
#include "SpectralConfig.hpp"

#include "Errors.hpp"

#include <fstream>
#include <stdexcept>

namespace ckd
{
namespace
{
std::string ScalarString(const YAML::Node &node, const std::string &key)
{
    if (!node.IsScalar())
    {
        throw ConfigError("config key '" + key + "' must be a scalar");
    }
    return node.as<std::string>();
}
}  // namespace

CKDSpectralConfig CKDSpectralConfig::FromNode(const YAML::Node &node)
{
    CKDSpectralConfig cfg;
    if (!node || node.IsNull())
    {
        return cfg;
    }
    if (!node.IsMap())
    {
        throw ConfigError("'spectral' block must be a mapping");
    }

    if (node["bin_set"])
    {
        cfg.bin_set = ScalarString(node["bin_set"], "spectral.bin_set");
    }

    const YAML::Node bins = node["bins"];
    if (bins && !bins.IsNull())
    {
        if (!bins.IsSequence())
        {
            throw ConfigError("'spectral.bins' must be a sequence of bin selectors");
        }
        for (const auto &spec : bins)
        {
            cfg.bins.push_back(spec);
        }
    }
    return cfg;
}

RunConfig RunConfig::FromNode(const YAML::Node &root)
{
    RunConfig cfg;
    if (!root || root.IsNull())
    {
        return cfg;
    }
    if (!root.IsMap())
    {
        throw ConfigError("config root must be a mapping");
    }

    const YAML::Node data = root["data"];
    if (data)
    {
        if (!data.IsMap())
        {
            throw ConfigError("'data' block must be a mapping");
        }
        if (data["root"])
        {
            cfg.data_root = ScalarString(data["root"], "data.root");
        }
    }
    const YAML::Node units = root["units"];
    if (units)
    {
        if (!units.IsMap())
        {
            throw ConfigError("'units' block must be a mapping");
        }
        if (units["wavelength"])
        {
            cfg.wavelength_unit = ParseUnit(ScalarString(units["wavelength"],
                                                         "units.wavelength"));
        }
    }
    cfg.spectral = CKDSpectralConfig::FromNode(root["spectral"]);
    return cfg;
}

RunConfig RunConfig::LoadFromConfig(const std::string &config_path)
{
    std::ifstream in(config_path);
    if (!in)
    {
        throw std::runtime_error("Failed to open config file: " + config_path);
    }
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(config_path);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError("failed to parse config file " + config_path + ": " + e.what());
    }
    return FromNode(root);
}
}  // namespace ckd
