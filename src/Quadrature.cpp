// Quadrature rules defined on the reference interval [-1, 1].
#include "Quadrature.hpp"

#include "Errors.hpp"
#include "Utils.hpp"

#include "mfem.hpp"

#include <sstream>

namespace ckd
{
namespace
{
enum class Rule1D
{
    Legendre,
    Lobatto
};

// MFEM computes 1D rules on the reference segment [0, 1] with weights summing
// to 1. Map them to [-1, 1]: x -> 2x - 1, w -> 2w.
void ComputeRule(Rule1D rule, int points, std::vector<double> &nodes,
                 std::vector<double> &weights)
{
    mfem::IntegrationRule ir;
    mfem::QuadratureFunctions1D qf;
    if (rule == Rule1D::Legendre)
    {
        qf.GaussLegendre(points, &ir);
    }
    else
    {
        qf.GaussLobatto(points, &ir);
    }

    nodes.resize(ir.GetNPoints());
    weights.resize(ir.GetNPoints());
    for (int i = 0; i < ir.GetNPoints(); ++i)
    {
        const mfem::IntegrationPoint &ip = ir.IntPoint(i);
        nodes[i] = 2.0 * ip.x - 1.0;
        weights[i] = 2.0 * ip.weight;
    }
}
}  // namespace

QuadType ParseQuadType(const std::string &name)
{
    const std::string key = utils::ToLower(utils::Trim(name));
    if (key == "gauss_legendre")
    {
        return QuadType::GaussLegendre;
    }
    if (key == "gauss_lobatto")
    {
        return QuadType::GaussLobatto;
    }
    throw ConfigError("unknown quadrature type '" + name + "'");
}

std::string QuadTypeName(QuadType type)
{
    switch (type)
    {
    case QuadType::GaussLegendre:
        return "gauss_legendre";
    case QuadType::GaussLobatto:
        return "gauss_lobatto";
    }
    return "unknown";
}

Quad::Quad(QuadType type, std::vector<double> nodes, std::vector<double> weights)
    : type_(type), nodes_(std::move(nodes)), weights_(std::move(weights))
{
    if (nodes_.size() != weights_.size())
    {
        std::ostringstream oss;
        oss << "nodes and weights arrays must have the same shape, got "
            << "nodes.size = " << nodes_.size()
            << " and weights.size = " << weights_.size();
        throw ValidationError(oss.str());
    }
}

Quad Quad::GaussLegendre(int n)
{
    if (n <= 0)
    {
        throw ConfigError("Gauss-Legendre rule requires positive point count.");
    }
    std::vector<double> nodes, weights;
    ComputeRule(Rule1D::Legendre, n, nodes, weights);
    return Quad(QuadType::GaussLegendre, std::move(nodes), std::move(weights));
}

Quad Quad::GaussLobatto(int n)
{
    if (n < 2)
    {
        throw ConfigError("Gauss-Lobatto rule requires at least 2 points.");
    }
    std::vector<double> nodes, weights;
    ComputeRule(Rule1D::Lobatto, n, nodes, weights);
    return Quad(QuadType::GaussLobatto, std::move(nodes), std::move(weights));
}

Quad Quad::New(const std::string &type, int n)
{
    return New(ParseQuadType(type), n);
}

Quad Quad::New(QuadType type, int n)
{
    switch (type)
    {
    case QuadType::GaussLegendre:
        return GaussLegendre(n);
    case QuadType::GaussLobatto:
        return GaussLobatto(n);
    }
    throw ConfigError("unknown quadrature type");
}

std::vector<double> Quad::EvalNodes(const std::optional<Interval> &interval) const
{
    if (!interval)
    {
        return nodes_;
    }
    const double a = interval->first;
    const double b = interval->second;
    std::vector<double> scaled(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i)
    {
        scaled[i] = 0.5 * (a + b + (b - a) * nodes_[i]);
    }
    return scaled;
}

double Quad::Integrate(const std::vector<double> &values,
                       const std::optional<Interval> &interval) const
{
    if (values.size() != weights_.size())
    {
        std::ostringstream oss;
        oss << "expected " << weights_.size() << " values at quadrature nodes, got "
            << values.size();
        throw ValidationError(oss.str());
    }

    double weighted_sum = 0.0;
    for (size_t i = 0; i < weights_.size(); ++i)
    {
        weighted_sum += weights_[i] * values[i];
    }

    if (!interval)
    {
        return weighted_sum;
    }
    return 0.5 * (interval->second - interval->first) * weighted_sum;
}

std::string Quad::Summary() const
{
    std::ostringstream oss;
    oss << "Quad(type=" << QuadTypeName(type_) << ", n=" << nodes_.size() << ")";
    return oss.str();
}
}  // namespace ckd
