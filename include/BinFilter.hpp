// Bin selection: primitive filters and the selection-spec dispatch.
#pragma once

#include "Bin.hpp"
#include "Units.hpp"

#include <yaml-cpp/yaml.h>

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ckd
{
/// Predicate deciding whether a bin is selected.
using BinFilter = std::function<bool(const Bin &)>;

/// Accept every bin.
BinFilter FilterAll();

/// Accept bins whose identifier is one of ids.
BinFilter FilterIds(std::vector<std::string> ids);

/// Accept bins in the spectral interval [wmin, wmax].
///
/// - wmin == wmax: bins strictly containing the point (edges do not count).
/// - endpoints == true: bins fully inside the interval, or bins containing
///   either interval bound strictly.
/// - endpoints == false: bins fully inside the interval only.
///
/// Throws ConfigError if wmin > wmax.
BinFilter FilterInterval(const Quantity &wmin, const Quantity &wmax,
                         bool endpoints = true);

/// Build a filter by type name ("all", "ids", "interval") from keyword
/// arguments stored in a YAML mapping. Throws ConfigError on unknown types
/// and on missing or malformed arguments.
BinFilter MakeFilter(const std::string &type, const YAML::Node &filter_kwargs);

/// (type, filter_kwargs) pair forwarded to MakeFilter.
using FilterTypeSpec = std::pair<std::string, YAML::Node>;

/// One bin selection specification:
///   - std::string: a single bin identifier;
///   - BinFilter: used verbatim;
///   - FilterTypeSpec: forwarded to MakeFilter;
///   - YAML::Node: plain data from a config file; a string scalar is an
///     identifier, [type, kwargs] and {type: ..., filter_kwargs: ...} are
///     forwarded to MakeFilter, and any other shape is rejected.
using FilterSpec = std::variant<std::string, BinFilter, FilterTypeSpec, YAML::Node>;

/// Turn one selection spec into a filter; throws ConfigError for
/// unrecognized shapes.
BinFilter ResolveFilterSpec(const FilterSpec &spec);

/// Read a wavelength from a config node: a bare number (configured
/// wavelength unit), a string such as "550 nm", or {value: 550, units: nm}.
Quantity WavelengthFromNode(const YAML::Node &node, const std::string &name);
}  // namespace ckd
