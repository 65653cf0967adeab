// CKD spectral bins and (bin, quadrature point) pairs.
#pragma once

#include "Quadrature.hpp"
#include "Units.hpp"

#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace ckd
{
class Bindex;

/// A spectral sub-interval [wmin, wmax] carrying a shared quadrature rule.
class Bin
{
public:
    /// Throws ValidationError unless wmin < wmax and quad is set.
    Bin(std::string id, Quantity wmin, Quantity wmax,
        std::shared_ptr<const Quad> quad);

    /// Bounds given as bare magnitudes in the configured wavelength unit.
    Bin(std::string id, double wmin, double wmax,
        std::shared_ptr<const Quad> quad);

    const std::string &Id() const { return id_; }
    const Quantity &Wmin() const { return wmin_; }
    const Quantity &Wmax() const { return wmax_; }
    const Quad &GetQuad() const { return *quad_; }
    const std::shared_ptr<const Quad> &QuadPtr() const { return quad_; }

    Quantity Width() const { return wmax_ - wmin_; }
    Quantity Wcenter() const { return (wmin_ + wmax_) * 0.5; }

    /// One bindex per quadrature node, in node order.
    std::vector<Bindex> Bindexes() const;

    /// Equal ids and bounds, and the same quadrature object.
    bool operator==(const Bin &rhs) const;
    bool operator!=(const Bin &rhs) const { return !(*this == rhs); }

private:
    std::string id_;
    Quantity wmin_;
    Quantity wmax_;
    std::shared_ptr<const Quad> quad_;
};

/// Canonical bin ordering key (wmin, wmax, id).
bool BinOrderLess(const Bin &a, const Bin &b);

/// Positional bin description: (id, wmin, wmax, quad).
using BinTuple = std::tuple<std::string, Quantity, Quantity, std::shared_ptr<const Quad>>;

/// Named-field bin description.
struct BinFields
{
    std::string id;
    Quantity wmin;
    Quantity wmax;
    std::shared_ptr<const Quad> quad;
};

/// Loose input accepted wherever a bin is expected.
using BinLike = std::variant<Bin, BinTuple, BinFields>;

/// Construct a bin from a tuple or field record, or pass a bin through.
Bin ConvertBin(const BinLike &value);

/// A (bin, quadrature point index) pair. The index is not checked against
/// the number of quadrature points.
class Bindex
{
public:
    Bindex(Bin bin, int index) : bin_(std::move(bin)), index_(index) {}

    const Bin &GetBin() const { return bin_; }
    int Index() const { return index_; }

    bool operator==(const Bindex &rhs) const
    {
        return index_ == rhs.index_ && bin_ == rhs.bin_;
    }
    bool operator!=(const Bindex &rhs) const { return !(*this == rhs); }

private:
    Bin bin_;
    int index_;
};

using BindexTuple = std::tuple<BinLike, int>;

struct BindexFields
{
    BinLike bin;
    int index = 0;
};

using BindexLike = std::variant<Bindex, BindexTuple, BindexFields>;

/// Construct a bindex from a tuple or field record (the bin part being itself
/// converted with ConvertBin), or pass a bindex through.
Bindex ConvertBindex(const BindexLike &value);
}  // namespace ckd
