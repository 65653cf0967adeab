// Bin selection: primitive filters and the selection-spec dispatch.
#include "BinFilter.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace ckd
{
namespace
{
std::string Describe(const YAML::Node &node)
{
    if (!node.IsDefined() || node.IsNull())
    {
        return "null";
    }
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

// Plain (unquoted) scalars that YAML would read as numbers or booleans are
// not accepted as bin identifiers; identifiers like 550 must be quoted.
bool IsStringScalar(const YAML::Node &node)
{
    if (!node.IsScalar())
    {
        return false;
    }
    if (node.Tag() == "!")
    {
        return true;
    }
    double d = 0.0;
    bool b = false;
    return !YAML::convert<double>::decode(node, d) && !YAML::convert<bool>::decode(node, b);
}

std::vector<std::string> IdsFromNode(const YAML::Node &node)
{
    if (!node || !node.IsSequence())
    {
        throw ConfigError("'ids' filter expects a sequence argument 'ids', got " +
                          Describe(node));
    }
    std::vector<std::string> ids;
    ids.reserve(node.size());
    for (const auto &item : node)
    {
        if (!item.IsScalar())
        {
            throw ConfigError("bin identifiers must be scalars, got " + Describe(item));
        }
        ids.push_back(item.as<std::string>());
    }
    return ids;
}

BinFilter FilterFromNode(const YAML::Node &node)
{
    if (IsStringScalar(node))
    {
        return FilterIds({node.as<std::string>()});
    }
    if (node.IsSequence() && node.size() == 2 && IsStringScalar(node[0]))
    {
        return MakeFilter(node[0].as<std::string>(), node[1]);
    }
    if (node.IsMap() && node.size() == 2 && node["type"] && node["filter_kwargs"] &&
        IsStringScalar(node["type"]))
    {
        return MakeFilter(node["type"].as<std::string>(), node["filter_kwargs"]);
    }
    throw ConfigError("unhandled CKD bin selector " + Describe(node));
}
}  // namespace

BinFilter FilterAll()
{
    return [](const Bin &) { return true; };
}

BinFilter FilterIds(std::vector<std::string> ids)
{
    return [ids = std::move(ids)](const Bin &bin) {
        return std::find(ids.begin(), ids.end(), bin.Id()) != ids.end();
    };
}

BinFilter FilterInterval(const Quantity &wmin, const Quantity &wmax, bool endpoints)
{
    if (wmin > wmax)
    {
        throw ConfigError("wmin must be lower or equal to wmax (got wmin = " +
                          wmin.ToString() + ", wmax = " + wmax.ToString() + ")");
    }

    if (wmin == wmax)
    {
        return [w = wmin](const Bin &bin) { return bin.Wmin() < w && w < bin.Wmax(); };
    }

    if (endpoints)
    {
        return [wmin, wmax](const Bin &bin) {
            return (wmin <= bin.Wmin() && bin.Wmax() <= wmax) ||
                   (bin.Wmin() < wmin && wmin < bin.Wmax()) ||
                   (bin.Wmin() < wmax && wmax < bin.Wmax());
        };
    }

    return [wmin, wmax](const Bin &bin) {
        return wmin <= bin.Wmin() && bin.Wmax() <= wmax;
    };
}

BinFilter MakeFilter(const std::string &type, const YAML::Node &filter_kwargs)
{
    if (type == "interval")
    {
        if (!filter_kwargs || !filter_kwargs.IsMap())
        {
            throw ConfigError("'interval' filter expects a mapping of arguments, got " +
                              Describe(filter_kwargs));
        }
        const Quantity wmin = WavelengthFromNode(filter_kwargs["wmin"], "wmin");
        const Quantity wmax = WavelengthFromNode(filter_kwargs["wmax"], "wmax");
        bool endpoints = true;
        if (filter_kwargs["endpoints"])
        {
            if (!YAML::convert<bool>::decode(filter_kwargs["endpoints"], endpoints))
            {
                throw ConfigError("'endpoints' must be a boolean, got " +
                                  Describe(filter_kwargs["endpoints"]));
            }
        }
        return FilterInterval(wmin, wmax, endpoints);
    }

    if (type == "ids")
    {
        if (!filter_kwargs || !filter_kwargs.IsMap())
        {
            throw ConfigError("'ids' filter expects a mapping of arguments, got " +
                              Describe(filter_kwargs));
        }
        return FilterIds(IdsFromNode(filter_kwargs["ids"]));
    }

    if (type == "all")
    {
        return FilterAll();
    }

    throw ConfigError("unknown bin filter type " + type);
}

BinFilter ResolveFilterSpec(const FilterSpec &spec)
{
    return std::visit(
        [](const auto &v) -> BinFilter {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>)
            {
                return FilterIds({v});
            }
            else if constexpr (std::is_same_v<T, BinFilter>)
            {
                if (!v)
                {
                    throw ConfigError("unhandled CKD bin selector: empty callable");
                }
                return v;
            }
            else if constexpr (std::is_same_v<T, FilterTypeSpec>)
            {
                return MakeFilter(v.first, v.second);
            }
            else
            {
                return FilterFromNode(v);
            }
        },
        spec);
}

Quantity WavelengthFromNode(const YAML::Node &node, const std::string &name)
{
    if (!node)
    {
        throw ConfigError("missing wavelength argument '" + name + "'");
    }
    if (node.IsMap())
    {
        if (!node["value"])
        {
            throw ConfigError("wavelength argument '" + name + "' lacks a 'value' field");
        }
        double value = 0.0;
        if (!YAML::convert<double>::decode(node["value"], value))
        {
            throw ConfigError("wavelength argument '" + name + "' has a non-numeric value: " +
                              Describe(node["value"]));
        }
        if (!std::isfinite(value))
        {
            throw ConfigError("wavelength argument '" + name + "' must be finite, got " +
                              Describe(node["value"]));
        }
        if (node["units"])
        {
            return Quantity::Parse(value, node["units"].as<std::string>());
        }
        return ConfigUnits().WavelengthQuantity(value);
    }
    if (node.IsScalar())
    {
        double value = 0.0;
        if (YAML::convert<double>::decode(node, value))
        {
            if (!std::isfinite(value))
            {
                throw ConfigError("wavelength argument '" + name + "' must be finite, got " +
                                  Describe(node));
            }
            return ConfigUnits().WavelengthQuantity(value);
        }
        return Quantity::FromString(node.as<std::string>());
    }
    throw ConfigError("cannot interpret wavelength argument '" + name + "': " +
                      Describe(node));
}
}  // namespace ckd
