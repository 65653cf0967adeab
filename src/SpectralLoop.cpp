// CKD spectral context and the per-bindex evaluation loop.
#include "SpectralLoop.hpp"

#include "BinFilter.hpp"

#include <sstream>
#include <stdexcept>

namespace ckd
{
CKDSpectralContext::CKDSpectralContext(std::shared_ptr<const BinSet> bin_set,
                                       std::vector<Bin> bins)
    : bin_set_(std::move(bin_set)), bins_(std::move(bins))
{
    if (!bin_set_)
    {
        throw std::invalid_argument("CKDSpectralContext requires a bin set.");
    }
    SortBins(bins_);
}

CKDSpectralContext CKDSpectralContext::Build(const CKDSpectralConfig &cfg,
                                             BinSetRegistry &registry)
{
    auto bin_set = registry.FromDb(cfg.bin_set);
    if (cfg.bins.empty())
    {
        return CKDSpectralContext(bin_set, bin_set->Bins());
    }

    std::vector<FilterSpec> specs(cfg.bins.begin(), cfg.bins.end());
    auto selected = bin_set->SelectBins(specs);
    return CKDSpectralContext(std::move(bin_set), std::move(selected));
}

std::vector<Bindex> CKDSpectralContext::Bindexes() const
{
    std::vector<Bindex> result;
    for (const auto &bin : bins_)
    {
        const auto bindexes = bin.Bindexes();
        result.insert(result.end(), bindexes.begin(), bindexes.end());
    }
    return result;
}

std::string CKDSpectralContext::Summary() const
{
    const LengthUnit unit = ConfigUnits().Wavelength();
    std::ostringstream oss;
    oss << "CKD spectral context\n";
    oss << "  bin set          : " << bin_set_->Summary() << "\n";
    oss << "  selected bins    : " << bins_.size() << "\n";
    oss << "  bindexes         : " << bins_.size() * bin_set_->GetQuad().Size() << "\n";
    for (const auto &bin : bins_)
    {
        oss << "    " << bin.Id() << " [" << bin.Wmin().MagnitudeIn(unit) << ", "
            << bin.Wmax().MagnitudeIn(unit) << "] " << UnitSymbol(unit) << "\n";
    }
    return oss.str();
}

std::vector<BinResult> RunSpectralLoop(const CKDSpectralContext &ctx,
                                       const RadPropEvaluator &evaluator)
{
    std::vector<BinResult> results;
    results.reserve(ctx.Bins().size());
    for (const auto &bin : ctx.Bins())
    {
        BinResult r;
        r.bin_id = bin.Id();
        for (const auto &bindex : bin.Bindexes())
        {
            r.values.push_back(evaluator.Eval(bindex, ctx.BinSetId()));
        }
        r.average = bin.GetQuad().Integrate(r.values, Interval{0.0, 1.0});
        results.push_back(std::move(r));
    }
    return results;
}
}  // namespace ckd
