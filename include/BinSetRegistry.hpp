// Memoized bin set factory backed by a dataset store.
#pragma once

#include "BinSet.hpp"
#include "Dataset.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

namespace ckd
{
/// Either a registered bin set id or an already built bin set.
using BinSetLike = std::variant<std::string, std::shared_ptr<const BinSet>>;

/// Builds bin sets from datasets stored under "ckd/bin_sets/{id}" and
/// memoizes them: repeated lookups of an id return the same BinSet object,
/// hence the same quadrature object for every bin of that id.
///
/// Lookups are serialized by a mutex; a bin set is published to the cache
/// only once fully constructed.
class BinSetRegistry
{
public:
    /// Default cache capacity; least recently used entries are evicted first.
    static constexpr size_t kDefaultCapacity = 128;

    /// capacity == 0 means unbounded.
    explicit BinSetRegistry(std::shared_ptr<DatasetStore> store,
                            size_t capacity = kDefaultCapacity,
                            bool verbose = false);

    /// Logical dataset path of a bin set id.
    static std::string DatasetPath(const std::string &id);

    /// Memoized lookup. Errors raised by the store (DatasetNotFoundError for
    /// unknown ids) propagate unchanged.
    std::shared_ptr<const BinSet> FromDb(const std::string &id);

    /// Bin set referenced by the `bin_set` attribute of a node dataset.
    std::shared_ptr<const BinSet> FromNodeDataset(const LabeledDataset &ds);

    /// Look up strings through FromDb; pass bin sets through.
    std::shared_ptr<const BinSet> Convert(const BinSetLike &value);

    /// Number of cached bin sets.
    size_t Size() const;
    size_t Capacity() const { return capacity_; }
    bool Contains(const std::string &id) const;

    /// Drop all cached bin sets.
    void Clear();

private:
    using Entry = std::pair<std::shared_ptr<const BinSet>, std::list<std::string>::iterator>;

    std::shared_ptr<DatasetStore> store_;
    size_t capacity_;
    bool verbose_;

    mutable std::mutex mutex_;
    std::list<std::string> lru_;  // most recent first
    std::unordered_map<std::string, Entry> cache_;
};
}  // namespace ckd
