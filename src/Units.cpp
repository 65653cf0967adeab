#include "Units.hpp"

#include "Errors.hpp"
#include "Utils.hpp"

#include <cmath>
#include <locale>
#include <sstream>

namespace ckd
{
namespace
{
// Size of one unit in angstroms. Every factor is an exact power of ten, so
// the ratio between two units is exact as well.
double AngstromsPer(LengthUnit unit)
{
    switch (unit)
    {
    case LengthUnit::Meter:
        return 1e10;
    case LengthUnit::Centimeter:
        return 1e8;
    case LengthUnit::Millimeter:
        return 1e7;
    case LengthUnit::Micrometer:
        return 1e4;
    case LengthUnit::Nanometer:
        return 10.0;
    case LengthUnit::Angstrom:
        return 1.0;
    }
    return 1.0;
}

// Coarser of two units; comparisons are carried out in it so that both
// operand orders round the same way.
LengthUnit CoarserUnit(LengthUnit a, LengthUnit b)
{
    return AngstromsPer(a) >= AngstromsPer(b) ? a : b;
}
}  // namespace

LengthUnit ParseUnit(const std::string &symbol)
{
    const std::string key = utils::ToLower(utils::Trim(symbol));
    if (key == "m" || key == "meter" || key == "metre")
    {
        return LengthUnit::Meter;
    }
    if (key == "cm" || key == "centimeter")
    {
        return LengthUnit::Centimeter;
    }
    if (key == "mm" || key == "millimeter")
    {
        return LengthUnit::Millimeter;
    }
    if (key == "um" || key == "micron" || key == "micrometer" || key == "µm")
    {
        return LengthUnit::Micrometer;
    }
    if (key == "nm" || key == "nanometer")
    {
        return LengthUnit::Nanometer;
    }
    if (key == "angstrom" || key == "a" || key == "å")
    {
        return LengthUnit::Angstrom;
    }
    throw ConfigError("Unknown length unit: '" + symbol + "'");
}

std::string UnitSymbol(LengthUnit unit)
{
    switch (unit)
    {
    case LengthUnit::Meter:
        return "m";
    case LengthUnit::Centimeter:
        return "cm";
    case LengthUnit::Millimeter:
        return "mm";
    case LengthUnit::Micrometer:
        return "um";
    case LengthUnit::Nanometer:
        return "nm";
    case LengthUnit::Angstrom:
        return "angstrom";
    }
    return "unknown";
}

Quantity Quantity::Parse(double magnitude, const std::string &unit_symbol)
{
    return Quantity(magnitude, ParseUnit(unit_symbol));
}

Quantity Quantity::FromString(const std::string &text)
{
    std::istringstream iss(utils::Trim(text));
    iss.imbue(std::locale::classic());
    double value = 0.0;
    if (!(iss >> value) || !std::isfinite(value))
    {
        throw ConfigError("Cannot parse quantity: '" + text + "'");
    }
    std::string rest;
    std::getline(iss, rest);
    const std::string unit = utils::Trim(rest);
    if (unit.empty())
    {
        return ConfigUnits().WavelengthQuantity(value);
    }
    return Parse(value, unit);
}

double Quantity::MagnitudeIn(LengthUnit unit) const
{
    if (unit == unit_)
    {
        return magnitude_;
    }
    const double from = AngstromsPer(unit_);
    const double to = AngstromsPer(unit);
    if (to > from)
    {
        return magnitude_ / (to / from);
    }
    return magnitude_ * (from / to);
}

std::string Quantity::ToString() const
{
    std::ostringstream oss;
    oss << magnitude_ << " " << UnitSymbol(unit_);
    return oss.str();
}

Quantity Quantity::operator+(const Quantity &rhs) const
{
    return Quantity(magnitude_ + rhs.MagnitudeIn(unit_), unit_);
}

Quantity Quantity::operator-(const Quantity &rhs) const
{
    return Quantity(magnitude_ - rhs.MagnitudeIn(unit_), unit_);
}

bool Quantity::operator<(const Quantity &rhs) const
{
    const LengthUnit unit = CoarserUnit(unit_, rhs.unit_);
    return MagnitudeIn(unit) < rhs.MagnitudeIn(unit);
}

bool Quantity::operator==(const Quantity &rhs) const
{
    const LengthUnit unit = CoarserUnit(unit_, rhs.unit_);
    return MagnitudeIn(unit) == rhs.MagnitudeIn(unit);
}

UnitContext &ConfigUnits()
{
    static UnitContext context;
    return context;
}
}  // namespace ckd
