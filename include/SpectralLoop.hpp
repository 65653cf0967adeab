// CKD spectral context and the per-bindex evaluation loop.
#pragma once

#include "Bin.hpp"
#include "BinSet.hpp"
#include "BinSetRegistry.hpp"
#include "SpectralConfig.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ckd
{
/// Radiative property evaluated at one spectral point.
class RadPropEvaluator
{
public:
    virtual ~RadPropEvaluator() = default;

    /// Value at a (bin, quadrature point) pair of the named bin set.
    virtual double Eval(const Bindex &bindex, const std::string &bin_set_id) const = 0;
};

/// Bin set and ordered bin selection of one run.
class CKDSpectralContext
{
public:
    CKDSpectralContext(std::shared_ptr<const BinSet> bin_set, std::vector<Bin> bins);

    /// Resolve the configured bin set through the registry and apply the
    /// bin selection (all bins when none is configured).
    static CKDSpectralContext Build(const CKDSpectralConfig &cfg, BinSetRegistry &registry);

    const BinSet &GetBinSet() const { return *bin_set_; }
    const std::string &BinSetId() const { return bin_set_->Id(); }
    const std::vector<Bin> &Bins() const { return bins_; }

    /// Bindexes of all selected bins, bin-major.
    std::vector<Bindex> Bindexes() const;

    /// Human-readable listing of the selected bins.
    std::string Summary() const;

private:
    std::shared_ptr<const BinSet> bin_set_;
    std::vector<Bin> bins_;
};

/// Per-bin evaluation result.
struct BinResult
{
    std::string bin_id;
    std::vector<double> values;  ///< one value per quadrature point
    double average = 0.0;        ///< quadrature average over g in [0, 1]
};

/// Evaluate every bindex of the context and average each bin over its
/// quadrature points (g-space [0, 1]).
std::vector<BinResult> RunSpectralLoop(const CKDSpectralContext &ctx,
                                       const RadPropEvaluator &evaluator);
}  // namespace ckd
