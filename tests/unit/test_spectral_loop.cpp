#include <gtest/gtest.h>

#include "Errors.hpp"
#include "SpectralLoop.hpp"

#include <cmath>
#include <memory>

using namespace ckd;

namespace {
class MemoryStore : public DatasetStore {
public:
    std::unique_ptr<LabeledDataset> Open(const std::string &logical_path) override {
        if (logical_path != "ckd/bin_sets/10nm") {
            throw DatasetNotFoundError("no dataset for '" + logical_path + "'");
        }
        auto ds = std::make_unique<LabeledDataset>();
        ds->SetAttr("quadrature_type", std::string("gauss_legendre"));
        ds->SetAttr("quadrature_n", 8LL);
        DataColumn wmin{{}, "nm"};
        DataColumn wmax{{}, "nm"};
        std::vector<std::string> ids;
        for (int center = 500; center <= 600; center += 10) {
            ids.push_back(std::to_string(center));
            wmin.values.push_back(center - 5.0);
            wmax.values.push_back(center + 5.0);
        }
        ds->SetBinIds(ids);
        ds->SetColumn("wmin", wmin);
        ds->SetColumn("wmax", wmax);
        return ds;
    }
};

class ConstantEvaluator : public RadPropEvaluator {
public:
    explicit ConstantEvaluator(double value) : value_(value) {}
    double Eval(const Bindex &, const std::string &) const override { return value_; }

private:
    double value_;
};

// Linear in the g-coordinate of the quadrature point: average is 0.5.
class LinearEvaluator : public RadPropEvaluator {
public:
    double Eval(const Bindex &bindex, const std::string &bin_set_id) const override {
        EXPECT_EQ(bin_set_id, "10nm");
        const Quad &quad = bindex.GetBin().GetQuad();
        return quad.EvalNodes(Interval{0.0, 1.0})[bindex.Index()];
    }
};

class SpectralLoopTest : public ::testing::Test {
protected:
    BinSetRegistry registry{std::make_shared<MemoryStore>()};
};
}  // namespace

TEST_F(SpectralLoopTest, EmptySelectionTakesAllBins) {
    CKDSpectralConfig cfg;
    const auto ctx = CKDSpectralContext::Build(cfg, registry);
    EXPECT_EQ(ctx.BinSetId(), "10nm");
    EXPECT_EQ(ctx.Bins().size(), 11u);
    EXPECT_EQ(ctx.Bindexes().size(), 11u * 8u);
}

TEST_F(SpectralLoopTest, ConfiguredSelection) {
    CKDSpectralConfig cfg;
    cfg.bins.push_back(YAML::Load("'550'"));
    cfg.bins.push_back(YAML::Load("[interval, {wmin: 580, wmax: 600, endpoints: false}]"));
    const auto ctx = CKDSpectralContext::Build(cfg, registry);

    ASSERT_EQ(ctx.Bins().size(), 2u);
    EXPECT_EQ(ctx.Bins()[0].Id(), "550");
    EXPECT_EQ(ctx.Bins()[1].Id(), "590");

    const auto bindexes = ctx.Bindexes();
    ASSERT_EQ(bindexes.size(), 16u);
    EXPECT_EQ(bindexes[0].GetBin().Id(), "550");
    EXPECT_EQ(bindexes[0].Index(), 0);
    EXPECT_EQ(bindexes[8].GetBin().Id(), "590");
    EXPECT_EQ(bindexes[15].Index(), 7);
}

TEST_F(SpectralLoopTest, BadSelectionThrows) {
    CKDSpectralConfig cfg;
    cfg.bins.push_back(YAML::Load("550"));
    EXPECT_THROW(CKDSpectralContext::Build(cfg, registry), ConfigError);

    CKDSpectralConfig missing;
    missing.bin_set = "1nm";
    EXPECT_THROW(CKDSpectralContext::Build(missing, registry), DatasetNotFoundError);
}

TEST_F(SpectralLoopTest, ConstantEvaluatorAveragesToConstant) {
    const auto ctx = CKDSpectralContext::Build(CKDSpectralConfig(), registry);
    const auto results = RunSpectralLoop(ctx, ConstantEvaluator(3.5));
    ASSERT_EQ(results.size(), ctx.Bins().size());
    for (const auto &r : results) {
        EXPECT_EQ(r.values.size(), 8u);
        EXPECT_NEAR(r.average, 3.5, 1e-12);
    }
    EXPECT_EQ(results.front().bin_id, "500");
}

TEST_F(SpectralLoopTest, LinearEvaluatorAveragesToHalf) {
    const auto ctx = CKDSpectralContext::Build(CKDSpectralConfig(), registry);
    for (const auto &r : RunSpectralLoop(ctx, LinearEvaluator())) {
        EXPECT_NEAR(r.average, 0.5, 1e-12);
    }
}

TEST_F(SpectralLoopTest, SummaryListsSelectedBins) {
    CKDSpectralConfig cfg;
    cfg.bins.push_back(YAML::Load("'520'"));
    const auto ctx = CKDSpectralContext::Build(cfg, registry);
    const std::string summary = ctx.Summary();
    EXPECT_NE(summary.find("selected bins    : 1"), std::string::npos);
    EXPECT_NE(summary.find("520 [515, 525] nm"), std::string::npos);
}
