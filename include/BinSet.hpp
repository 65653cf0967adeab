// A canonically ordered set of CKD bins sharing one quadrature rule.
#pragma once

#include "Bin.hpp"
#include "BinFilter.hpp"
#include "Dataset.hpp"
#include "Quadrature.hpp"
#include "Units.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ckd
{
/// Spectral discretization: bins sorted by (wmin, wmax, id), all referencing
/// the bin set's own quadrature object.
class BinSet
{
public:
    /// Sorts bins (identical duplicates are dropped) and throws
    /// ValidationError if any bin references a quadrature object other than
    /// quad.
    BinSet(std::string id, std::shared_ptr<const Quad> quad, std::vector<Bin> bins);

    /// Build from a dataset holding `quadrature_type` / `quadrature_n`
    /// attributes and `bin`, `wmin`, `wmax` columns. All bins share one
    /// newly created quadrature rule.
    static BinSet FromDataset(const std::string &id, const LabeledDataset &ds);

    /// Copy with a different list of bins (sorted and validated again).
    BinSet WithBins(std::vector<Bin> bins) const;

    const std::string &Id() const { return id_; }
    const Quad &GetQuad() const { return *quad_; }
    const std::shared_ptr<const Quad> &QuadPtr() const { return quad_; }
    const std::vector<Bin> &Bins() const { return bins_; }
    size_t Size() const { return bins_.size(); }

    std::vector<std::string> BinIds() const;
    /// Lower/upper bounds in the configured wavelength unit.
    QuantityArray BinWmins() const;
    QuantityArray BinWmaxs() const;

    /// Bins accepted by at least one filter, in canonical order.
    std::vector<Bin> FilterBins(const std::vector<BinFilter> &filters) const;

    /// High-level wrapper around FilterBins resolving selection specs.
    std::vector<Bin> SelectBins(const std::vector<FilterSpec> &specs) const;

    /// "BinSet(id='10nm', quad=Quad(...), bins=tuple<N>(...))"
    std::string Summary() const;

    /// Write the summary, the quadrature rule and one line per bin.
    void WriteToFile(const std::string &path) const;

private:
    std::string id_;
    std::shared_ptr<const Quad> quad_;
    std::vector<Bin> bins_;
};

/// Sort bins by (wmin, wmax, id).
void SortBins(std::vector<Bin> &bins);
}  // namespace ckd
