// A canonically ordered set of CKD bins sharing one quadrature rule.
#include "BinSet.hpp"

#include "Errors.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace ckd
{
namespace
{
std::string BinsRepr(const std::vector<Bin> &bins)
{
    std::ostringstream oss;
    if (bins.size() >= 5)
    {
        oss << "tuple<" << bins.size() << ">("
            << "Bin('" << bins[0].Id() << "', ... ), "
            << "Bin('" << bins[1].Id() << "', ... ), ... , "
            << "Bin('" << bins[bins.size() - 2].Id() << "', ... ), "
            << "Bin('" << bins.back().Id() << "', ... ))";
        return oss.str();
    }
    oss << "(";
    for (size_t i = 0; i < bins.size(); ++i)
    {
        oss << "'" << bins[i].Id() << "'";
        if (i + 1 < bins.size() || bins.size() == 1)
        {
            oss << ",";
        }
        if (i + 1 < bins.size())
        {
            oss << " ";
        }
    }
    oss << ")";
    return oss.str();
}

QuantityArray Magnitudes(const std::vector<Bin> &bins, bool lower)
{
    QuantityArray result;
    result.unit = ConfigUnits().Wavelength();
    result.magnitudes.reserve(bins.size());
    for (const auto &bin : bins)
    {
        const Quantity &w = lower ? bin.Wmin() : bin.Wmax();
        result.magnitudes.push_back(w.MagnitudeIn(result.unit));
    }
    return result;
}
}  // namespace

void SortBins(std::vector<Bin> &bins)
{
    std::stable_sort(bins.begin(), bins.end(), BinOrderLess);
}

BinSet::BinSet(std::string id, std::shared_ptr<const Quad> quad, std::vector<Bin> bins)
    : id_(std::move(id)), quad_(std::move(quad)), bins_(std::move(bins))
{
    SortBins(bins_);
    bins_.erase(std::unique(bins_.begin(), bins_.end()), bins_.end());

    for (const auto &bin : bins_)
    {
        if (bin.QuadPtr() != quad_)
        {
            throw ValidationError("while validating bins of bin set '" + id_ +
                                  "': all defined bins must share the same quadrature "
                                  "as their parent bin set (offending bin: '" +
                                  bin.Id() + "')");
        }
    }
}

BinSet BinSet::FromDataset(const std::string &id, const LabeledDataset &ds)
{
    // Collect quadrature data
    const std::string quad_type = ds.AttrString("quadrature_type");
    const long long quad_n = ds.AttrInt("quadrature_n");
    if (quad_n < 1 || quad_n > std::numeric_limits<int>::max())
    {
        throw ValidationError("bin set dataset '" + id + "' has an out-of-range "
                              "quadrature_n: " + std::to_string(quad_n));
    }
    auto quad = std::make_shared<const Quad>(Quad::New(quad_type, static_cast<int>(quad_n)));

    // Collect bin set data
    const auto &bin_ids = ds.BinIds();
    const DataColumn &wmin = ds.Column("wmin");
    const DataColumn &wmax = ds.Column("wmax");
    if (wmin.values.size() != bin_ids.size() || wmax.values.size() != bin_ids.size())
    {
        std::ostringstream oss;
        oss << "bin set dataset '" << id << "' has inconsistent column sizes (bin: "
            << bin_ids.size() << ", wmin: " << wmin.values.size()
            << ", wmax: " << wmax.values.size() << ")";
        throw ValidationError(oss.str());
    }

    std::vector<Bin> bins;
    bins.reserve(bin_ids.size());
    for (size_t i = 0; i < bin_ids.size(); ++i)
    {
        bins.emplace_back(bin_ids[i], Quantity::Parse(wmin.values[i], wmin.units),
                          Quantity::Parse(wmax.values[i], wmax.units), quad);
    }

    return BinSet(id, quad, std::move(bins));
}

BinSet BinSet::WithBins(std::vector<Bin> bins) const
{
    return BinSet(id_, quad_, std::move(bins));
}

std::vector<std::string> BinSet::BinIds() const
{
    std::vector<std::string> ids;
    ids.reserve(bins_.size());
    for (const auto &bin : bins_)
    {
        ids.push_back(bin.Id());
    }
    return ids;
}

QuantityArray BinSet::BinWmins() const
{
    return Magnitudes(bins_, true);
}

QuantityArray BinSet::BinWmaxs() const
{
    return Magnitudes(bins_, false);
}

std::vector<Bin> BinSet::FilterBins(const std::vector<BinFilter> &filters) const
{
    std::vector<Bin> selected;
    for (const auto &bin : bins_)
    {
        for (const auto &filter : filters)
        {
            if (filter(bin))
            {
                selected.push_back(bin);
                break;
            }
        }
    }
    SortBins(selected);
    return selected;
}

std::vector<Bin> BinSet::SelectBins(const std::vector<FilterSpec> &specs) const
{
    std::vector<BinFilter> filters;
    filters.reserve(specs.size());
    for (const auto &spec : specs)
    {
        filters.push_back(ResolveFilterSpec(spec));
    }
    return FilterBins(filters);
}

std::string BinSet::Summary() const
{
    std::ostringstream oss;
    oss << "BinSet(id='" << id_ << "', quad=" << quad_->Summary()
        << ", bins=" << BinsRepr(bins_) << ")";
    return oss.str();
}

void BinSet::WriteToFile(const std::string &path) const
{
    utils::EnsureParentDirectory(path);
    std::ofstream ofs(path);
    if (!ofs)
    {
        throw std::runtime_error("Failed to open bin set log: " + path);
    }

    const LengthUnit unit = ConfigUnits().Wavelength();
    ofs << "Bin set summary\n";
    ofs << "  id               : " << id_ << "\n";
    ofs << "  quadrature       : " << quad_->Summary() << "\n";
    ofs << "  bins             : " << bins_.size() << "\n";
    ofs << "  wavelength unit  : " << UnitSymbol(unit) << "\n\n";
    utils::WriteVector(ofs, quad_->Nodes(), "nodes");
    utils::WriteVector(ofs, quad_->Weights(), "weights");

    ofs << "\nBins (idx, id, wmin, wmax, wcenter)\n";
    for (size_t i = 0; i < bins_.size(); ++i)
    {
        const auto &b = bins_[i];
        ofs << i << " " << b.Id() << " "
            << b.Wmin().MagnitudeIn(unit) << " "
            << b.Wmax().MagnitudeIn(unit) << " "
            << b.Wcenter().MagnitudeIn(unit) << "\n";
    }
    ofs << std::flush;
}
}  // namespace ckd
