#include <gtest/gtest.h>

#include "Dataset.hpp"
#include "Errors.hpp"

#include <filesystem>
#include <fstream>

using namespace ckd;
namespace fs = std::filesystem;

namespace {
fs::path MakeTempRoot(const std::string &name) {
    const fs::path root = fs::temp_directory_path() / name;
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}
}  // namespace

TEST(DatasetTest, TypedAttributeAccess) {
    LabeledDataset ds;
    ds.SetAttr("quadrature_type", std::string("gauss_legendre"));
    ds.SetAttr("quadrature_n", 16LL);
    ds.SetAttr("scale", 0.5);

    EXPECT_TRUE(ds.HasAttr("quadrature_n"));
    EXPECT_FALSE(ds.HasAttr("bin_set"));
    EXPECT_EQ(ds.AttrString("quadrature_type"), "gauss_legendre");
    EXPECT_EQ(ds.AttrInt("quadrature_n"), 16);

    EXPECT_THROW(ds.AttrString("bin_set"), ValidationError);
    EXPECT_THROW(ds.AttrString("quadrature_n"), ValidationError);
    EXPECT_THROW(ds.AttrInt("scale"), ValidationError);
    EXPECT_THROW(ds.Column("wmin"), ValidationError);
}

TEST(DatasetTest, YamlStoreReadsLayout) {
    const fs::path root = MakeTempRoot("ckd_dataset_read");
    fs::create_directories(root / "ckd" / "bin_sets");
    {
        std::ofstream ofs(root / "ckd" / "bin_sets" / "test.yaml");
        ofs << "attrs:\n"
               "  quadrature_type: gauss_lobatto\n"
               "  quadrature_n: 4\n"
               "bin: [\"510\", \"520\"]\n"
               "wmin: {units: nm, values: [505.0, 515.0]}\n"
               "wmax: {units: nm, values: [515.0, 525.0]}\n";
    }

    YamlDatasetStore store(root.string());
    EXPECT_EQ(store.ResolvePath("ckd/bin_sets/test"),
              (root / "ckd/bin_sets/test.yaml").string());

    const auto ds = store.Open("ckd/bin_sets/test");
    ASSERT_TRUE(ds);
    EXPECT_EQ(ds->AttrString("quadrature_type"), "gauss_lobatto");
    EXPECT_EQ(ds->AttrInt("quadrature_n"), 4);
    ASSERT_EQ(ds->BinIds().size(), 2u);
    EXPECT_EQ(ds->BinIds()[0], "510");
    EXPECT_EQ(ds->Column("wmin").units, "nm");
    EXPECT_DOUBLE_EQ(ds->Column("wmax").values[1], 525.0);

    fs::remove_all(root);
}

TEST(DatasetTest, YamlStoreWriteThenOpen) {
    const fs::path root = MakeTempRoot("ckd_dataset_write");

    LabeledDataset ds;
    ds.SetAttr("quadrature_type", std::string("gauss_legendre"));
    ds.SetAttr("quadrature_n", 8LL);
    ds.SetBinIds({"1000", "1010"});
    ds.SetColumn("wmin", DataColumn{{0.995, 1.005}, "um"});
    ds.SetColumn("wmax", DataColumn{{1.005, 1.015}, "um"});

    YamlDatasetStore store(root.string());
    YamlDatasetStore::Write(ds, store.ResolvePath("ckd/bin_sets/um"));

    const auto loaded = store.Open("ckd/bin_sets/um");
    EXPECT_EQ(loaded->AttrString("quadrature_type"), "gauss_legendre");
    EXPECT_EQ(loaded->AttrInt("quadrature_n"), 8);
    EXPECT_EQ(loaded->BinIds(), ds.BinIds());
    EXPECT_EQ(loaded->Column("wmin").units, "um");
    EXPECT_EQ(loaded->Column("wmax").values.size(), 2u);

    fs::remove_all(root);
}

TEST(DatasetTest, MissingDatasetThrowsNotFound) {
    const fs::path root = MakeTempRoot("ckd_dataset_missing");
    YamlDatasetStore store(root.string());
    EXPECT_THROW(store.Open("ckd/bin_sets/does_not_exist"), DatasetNotFoundError);
    fs::remove_all(root);
}

TEST(DatasetTest, MalformedColumnThrows) {
    const fs::path root = MakeTempRoot("ckd_dataset_malformed");
    {
        std::ofstream ofs(root / "bad.yaml");
        ofs << "attrs: {quadrature_type: gauss_legendre, quadrature_n: 2}\n"
               "bin: [\"a\"]\n"
               "wmin: [1.0]\n";
    }
    YamlDatasetStore store(root.string());
    EXPECT_THROW(store.Open("bad"), ValidationError);
    fs::remove_all(root);
}

TEST(DatasetTest, QuotedNumericAttributeStaysString) {
    const fs::path root = MakeTempRoot("ckd_dataset_quoted");
    {
        std::ofstream ofs(root / "node.yaml");
        ofs << "attrs:\n"
               "  bin_set: \"1000\"\n"
               "  quadrature_n: 16\n";
    }
    YamlDatasetStore store(root.string());
    const auto ds = store.Open("node");
    EXPECT_EQ(ds->AttrString("bin_set"), "1000");
    EXPECT_EQ(ds->AttrInt("quadrature_n"), 16);

    // Written string attributes keep their type when read back.
    YamlDatasetStore::Write(*ds, store.ResolvePath("copy"));
    EXPECT_EQ(store.Open("copy")->AttrString("bin_set"), "1000");

    fs::remove_all(root);
}
