// Quadrature rules defined on the reference interval [-1, 1].
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ckd
{
/// Quadrature rule families.
enum class QuadType
{
    GaussLegendre,
    GaussLobatto
};

/// Closed interval [a, b] used to rescale nodes and integrals.
using Interval = std::pair<double, double>;

/// Parse a quadrature type name ("gauss_legendre" or "gauss_lobatto",
/// case-insensitive). Throws ConfigError otherwise.
QuadType ParseQuadType(const std::string &name);

/// Canonical name of a quadrature type.
std::string QuadTypeName(QuadType type);

/// Nodes and weights of a quadrature rule on [-1, 1]. Immutable; bins of a
/// bin set share one instance through std::shared_ptr<const Quad>.
class Quad
{
public:
    /// Throws ValidationError if nodes and weights differ in size.
    Quad(QuadType type, std::vector<double> nodes, std::vector<double> weights);

    /// Gauss-Legendre rule with n points (n >= 1).
    static Quad GaussLegendre(int n);

    /// Gauss-Lobatto rule with n points (n >= 2).
    static Quad GaussLobatto(int n);

    /// Rule of the named type; throws ConfigError on unknown type or bad n.
    static Quad New(const std::string &type, int n);
    static Quad New(QuadType type, int n);

    /// Nodes mapped affinely from [-1, 1] to interval; the raw nodes when no
    /// interval is given.
    std::vector<double> EvalNodes(const std::optional<Interval> &interval = std::nullopt) const;

    /// Weighted sum of values at the nodes, scaled by 0.5 * (b - a) when an
    /// interval is given.
    double Integrate(const std::vector<double> &values,
                     const std::optional<Interval> &interval = std::nullopt) const;

    QuadType Type() const { return type_; }
    const std::vector<double> &Nodes() const { return nodes_; }
    const std::vector<double> &Weights() const { return weights_; }
    int Size() const { return static_cast<int>(nodes_.size()); }

    /// "Quad(type=gauss_legendre, n=16)"
    std::string Summary() const;

private:
    QuadType type_;
    std::vector<double> nodes_;
    std::vector<double> weights_;
};
}  // namespace ckd
