#include "Bin.hpp"

#include "Errors.hpp"

#include <type_traits>

namespace ckd
{
Bin::Bin(std::string id, Quantity wmin, Quantity wmax,
         std::shared_ptr<const Quad> quad)
    : id_(std::move(id)), wmin_(wmin), wmax_(wmax), quad_(std::move(quad))
{
    if (!(wmin_ < wmax_))
    {
        throw ValidationError("while validating bin '" + id_ +
                              "': wmin must be lower than wmax (got wmin = " +
                              wmin_.ToString() + ", wmax = " + wmax_.ToString() + ")");
    }
    if (!quad_)
    {
        throw ValidationError("while validating bin '" + id_ +
                              "': a quadrature rule is required");
    }
}

Bin::Bin(std::string id, double wmin, double wmax,
         std::shared_ptr<const Quad> quad)
    : Bin(std::move(id), ConfigUnits().WavelengthQuantity(wmin),
          ConfigUnits().WavelengthQuantity(wmax), std::move(quad))
{
}

std::vector<Bindex> Bin::Bindexes() const
{
    std::vector<Bindex> result;
    result.reserve(quad_->Size());
    for (int i = 0; i < quad_->Size(); ++i)
    {
        result.emplace_back(*this, i);
    }
    return result;
}

bool Bin::operator==(const Bin &rhs) const
{
    return id_ == rhs.id_ && wmin_ == rhs.wmin_ && wmax_ == rhs.wmax_ &&
           quad_ == rhs.quad_;
}

bool BinOrderLess(const Bin &a, const Bin &b)
{
    if (a.Wmin() != b.Wmin())
    {
        return a.Wmin() < b.Wmin();
    }
    if (a.Wmax() != b.Wmax())
    {
        return a.Wmax() < b.Wmax();
    }
    return a.Id() < b.Id();
}

Bin ConvertBin(const BinLike &value)
{
    return std::visit(
        [](const auto &v) -> Bin {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, BinTuple>)
            {
                return Bin(std::get<0>(v), std::get<1>(v), std::get<2>(v), std::get<3>(v));
            }
            else if constexpr (std::is_same_v<T, BinFields>)
            {
                return Bin(v.id, v.wmin, v.wmax, v.quad);
            }
            else
            {
                return v;
            }
        },
        value);
}

Bindex ConvertBindex(const BindexLike &value)
{
    return std::visit(
        [](const auto &v) -> Bindex {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, BindexTuple>)
            {
                return Bindex(ConvertBin(std::get<0>(v)), std::get<1>(v));
            }
            else if constexpr (std::is_same_v<T, BindexFields>)
            {
                return Bindex(ConvertBin(v.bin), v.index);
            }
            else
            {
                return v;
            }
        },
        value);
}
}  // namespace ckd
