// Wavelength quantities: a magnitude tagged with a length unit.
#pragma once

#include <string>
#include <vector>

namespace ckd
{
/// Length units accepted for spectral coordinates.
enum class LengthUnit
{
    Meter,
    Centimeter,
    Millimeter,
    Micrometer,
    Nanometer,
    Angstrom
};

/// Parse a unit symbol ("nm", "micron", "um", "angstrom", ...). Throws
/// ConfigError for unknown symbols.
LengthUnit ParseUnit(const std::string &symbol);

/// Canonical symbol of a unit ("nm", "um", ...).
std::string UnitSymbol(LengthUnit unit);

/// Magnitude with an attached length unit. Arithmetic results keep the
/// left-hand side unit; comparisons are evaluated in the coarser of the two
/// units, independently of operand order.
class Quantity
{
public:
    Quantity() = default;
    Quantity(double magnitude, LengthUnit unit) : magnitude_(magnitude), unit_(unit) {}

    /// Build from a magnitude and a unit symbol read from dataset metadata.
    static Quantity Parse(double magnitude, const std::string &unit_symbol);

    /// Parse "<value> <unit>", e.g. "550 nm" or "0.55um".
    static Quantity FromString(const std::string &text);

    double Magnitude() const { return magnitude_; }
    LengthUnit Unit() const { return unit_; }

    /// Magnitude expressed in another unit.
    double MagnitudeIn(LengthUnit unit) const;

    /// Same quantity expressed in another unit.
    Quantity To(LengthUnit unit) const { return Quantity(MagnitudeIn(unit), unit); }

    std::string ToString() const;

    Quantity operator+(const Quantity &rhs) const;
    Quantity operator-(const Quantity &rhs) const;
    Quantity operator*(double factor) const { return Quantity(magnitude_ * factor, unit_); }

    bool operator<(const Quantity &rhs) const;
    bool operator>(const Quantity &rhs) const { return rhs < *this; }
    bool operator<=(const Quantity &rhs) const { return !(rhs < *this); }
    bool operator>=(const Quantity &rhs) const { return !(*this < rhs); }
    bool operator==(const Quantity &rhs) const;
    bool operator!=(const Quantity &rhs) const { return !(*this == rhs); }

private:
    double magnitude_ = 0.0;
    LengthUnit unit_ = LengthUnit::Nanometer;
};

/// Array of magnitudes sharing one unit.
struct QuantityArray
{
    std::vector<double> magnitudes;
    LengthUnit unit = LengthUnit::Nanometer;
};

/// Default units used to interpret bare magnitudes supplied by users.
class UnitContext
{
public:
    LengthUnit Wavelength() const { return wavelength_; }
    void SetWavelength(LengthUnit unit) { wavelength_ = unit; }

    /// Wrap a bare magnitude with the default wavelength unit.
    Quantity WavelengthQuantity(double magnitude) const
    {
        return Quantity(magnitude, wavelength_);
    }

private:
    LengthUnit wavelength_ = LengthUnit::Nanometer;
};

/// Process-wide unit context used when interpreting configuration values.
UnitContext &ConfigUnits();
}  // namespace ckd
