// Labeled datasets and the store they are opened from.
#include "Dataset.hpp"

#include "Errors.hpp"
#include "Utils.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace ckd
{
namespace
{
AttributeValue ReadAttribute(const YAML::Node &node)
{
    // Quoted scalars stay strings even when they look numeric.
    if (node.IsScalar() && node.Tag() == "!")
    {
        return node.as<std::string>();
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i))
    {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d))
    {
        return d;
    }
    return node.as<std::string>();
}

DataColumn ReadColumn(const YAML::Node &node, const std::string &name,
                      const std::string &path)
{
    if (!node.IsMap() || !node["values"] || !node["values"].IsSequence())
    {
        throw ValidationError("column '" + name + "' in " + path +
                              " must be a mapping with a 'values' sequence");
    }
    DataColumn column;
    if (node["units"])
    {
        column.units = node["units"].as<std::string>();
    }
    column.values.reserve(node["values"].size());
    for (const auto &v : node["values"])
    {
        double value = 0.0;
        if (!YAML::convert<double>::decode(v, value))
        {
            throw ValidationError("column '" + name + "' in " + path +
                                  " holds a non-numeric value");
        }
        column.values.push_back(value);
    }
    return column;
}
}  // namespace

void LabeledDataset::SetAttr(const std::string &name, AttributeValue value)
{
    attrs_[name] = std::move(value);
}

bool LabeledDataset::HasAttr(const std::string &name) const
{
    return attrs_.count(name) > 0;
}

const std::string &LabeledDataset::AttrString(const std::string &name) const
{
    const auto it = attrs_.find(name);
    if (it == attrs_.end())
    {
        throw ValidationError("dataset has no attribute '" + name + "'");
    }
    const auto *value = std::get_if<std::string>(&it->second);
    if (!value)
    {
        throw ValidationError("dataset attribute '" + name + "' is not a string");
    }
    return *value;
}

long long LabeledDataset::AttrInt(const std::string &name) const
{
    const auto it = attrs_.find(name);
    if (it == attrs_.end())
    {
        throw ValidationError("dataset has no attribute '" + name + "'");
    }
    const auto *value = std::get_if<long long>(&it->second);
    if (!value)
    {
        throw ValidationError("dataset attribute '" + name + "' is not an integer");
    }
    return *value;
}

void LabeledDataset::SetColumn(const std::string &name, DataColumn column)
{
    columns_[name] = std::move(column);
}

bool LabeledDataset::HasColumn(const std::string &name) const
{
    return columns_.count(name) > 0;
}

const DataColumn &LabeledDataset::Column(const std::string &name) const
{
    const auto it = columns_.find(name);
    if (it == columns_.end())
    {
        throw ValidationError("dataset has no column '" + name + "'");
    }
    return it->second;
}

std::string YamlDatasetStore::ResolvePath(const std::string &logical_path) const
{
    return (fs::path(root_) / (logical_path + ".yaml")).string();
}

std::unique_ptr<LabeledDataset> YamlDatasetStore::Open(const std::string &logical_path)
{
    const std::string path = ResolvePath(logical_path);
    if (!fs::exists(path))
    {
        throw DatasetNotFoundError("no dataset for '" + logical_path + "' (looked for " +
                                   path + ")");
    }

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception &e)
    {
        throw ValidationError("failed to parse dataset " + path + ": " + e.what());
    }
    if (!root.IsMap())
    {
        throw ValidationError("dataset " + path + " is not a YAML mapping");
    }

    auto ds = std::make_unique<LabeledDataset>();
    if (root["attrs"])
    {
        for (const auto &kv : root["attrs"])
        {
            ds->SetAttr(kv.first.as<std::string>(), ReadAttribute(kv.second));
        }
    }
    if (root["bin"])
    {
        ds->SetBinIds(root["bin"].as<std::vector<std::string>>());
    }
    for (const char *name : {"wmin", "wmax"})
    {
        if (root[name])
        {
            ds->SetColumn(name, ReadColumn(root[name], name, path));
        }
    }
    return ds;
}

void YamlDatasetStore::Write(const LabeledDataset &ds, const std::string &path)
{
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "attrs" << YAML::Value << YAML::BeginMap;
    for (const auto &[name, value] : ds.Attrs())
    {
        out << YAML::Key << name << YAML::Value;
        std::visit(
            [&out](const auto &v) {
                if constexpr (std::is_same_v<std::decay_t<decltype(v)>, std::string>)
                {
                    out << YAML::DoubleQuoted << v;
                }
                else
                {
                    out << v;
                }
            },
            value);
    }
    out << YAML::EndMap;

    if (!ds.BinIds().empty())
    {
        out << YAML::Key << "bin" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto &id : ds.BinIds())
        {
            out << YAML::DoubleQuoted << id;
        }
        out << YAML::EndSeq;
    }

    for (const char *name : {"wmin", "wmax"})
    {
        if (!ds.HasColumn(name))
        {
            continue;
        }
        const DataColumn &column = ds.Column(name);
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "units" << YAML::Value << column.units;
        out << YAML::Key << "values" << YAML::Value << YAML::Flow << column.values;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    utils::EnsureParentDirectory(path);
    std::ofstream ofs(path);
    if (!ofs)
    {
        throw std::runtime_error("Failed to open dataset file for writing: " + path);
    }
    ofs << out.c_str() << "\n";
}
}  // namespace ckd
