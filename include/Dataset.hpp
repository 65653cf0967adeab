// Labeled datasets and the store they are opened from.
#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ckd
{
/// Global dataset attribute value.
using AttributeValue = std::variant<std::string, long long, double>;

/// Numeric data column with a unit tag.
struct DataColumn
{
    std::vector<double> values;
    std::string units;
};

/// In-memory view of a bin set (or bin set reference) dataset: global
/// attributes, the `bin` identifier column and named numeric columns
/// (`wmin`, `wmax`). The handle is closed when destroyed.
class LabeledDataset
{
public:
    virtual ~LabeledDataset() = default;

    void SetAttr(const std::string &name, AttributeValue value);
    bool HasAttr(const std::string &name) const;

    /// Typed attribute access; throws ValidationError if missing or of the
    /// wrong type.
    const std::string &AttrString(const std::string &name) const;
    long long AttrInt(const std::string &name) const;

    const std::map<std::string, AttributeValue> &Attrs() const { return attrs_; }

    void SetBinIds(std::vector<std::string> ids) { bin_ids_ = std::move(ids); }
    const std::vector<std::string> &BinIds() const { return bin_ids_; }

    void SetColumn(const std::string &name, DataColumn column);
    bool HasColumn(const std::string &name) const;
    /// Throws ValidationError if missing.
    const DataColumn &Column(const std::string &name) const;

private:
    std::map<std::string, AttributeValue> attrs_;
    std::vector<std::string> bin_ids_;
    std::map<std::string, DataColumn> columns_;
};

/// Source of labeled datasets addressed by logical path
/// (e.g. "ckd/bin_sets/10nm").
class DatasetStore
{
public:
    virtual ~DatasetStore() = default;

    /// Open a dataset; throws DatasetNotFoundError if the path has no
    /// backing data.
    virtual std::unique_ptr<LabeledDataset> Open(const std::string &logical_path) = 0;
};

/// Dataset store backed by YAML files: logical path "a/b" resolves to
/// "<root>/a/b.yaml".
///
/// Expected layout:
///   attrs:
///     quadrature_type: gauss_legendre
///     quadrature_n: 16
///   bin: ["510", "520"]
///   wmin: {units: nm, values: [505.0, 515.0]}
///   wmax: {units: nm, values: [515.0, 525.0]}
class YamlDatasetStore : public DatasetStore
{
public:
    explicit YamlDatasetStore(std::string root) : root_(std::move(root)) {}

    std::unique_ptr<LabeledDataset> Open(const std::string &logical_path) override;

    /// File backing a logical path.
    std::string ResolvePath(const std::string &logical_path) const;

    const std::string &Root() const { return root_; }

    /// Write a dataset in the layout read by Open.
    static void Write(const LabeledDataset &ds, const std::string &path);

private:
    std::string root_;
};
}  // namespace ckd
