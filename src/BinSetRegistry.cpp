// Memoized bin set factory backed by a dataset store.
#include "BinSetRegistry.hpp"

#include <iostream>
#include <stdexcept>

namespace ckd
{
BinSetRegistry::BinSetRegistry(std::shared_ptr<DatasetStore> store, size_t capacity,
                               bool verbose)
    : store_(std::move(store)), capacity_(capacity), verbose_(verbose)
{
    if (!store_)
    {
        throw std::invalid_argument("BinSetRegistry requires a dataset store.");
    }
}

std::string BinSetRegistry::DatasetPath(const std::string &id)
{
    return "ckd/bin_sets/" + id;
}

std::shared_ptr<const BinSet> BinSetRegistry::FromDb(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const auto it = cache_.find(id);
    if (it != cache_.end())
    {
        lru_.splice(lru_.begin(), lru_, it->second.second);
        return it->second.first;
    }

    std::shared_ptr<const BinSet> bin_set;
    {
        // The dataset handle is closed when leaving this scope.
        const auto ds = store_->Open(DatasetPath(id));
        bin_set = std::make_shared<const BinSet>(BinSet::FromDataset(id, *ds));
    }
    if (verbose_)
    {
        std::cout << "Loaded bin set '" << id << "' from " << DatasetPath(id) << ": "
                  << bin_set->Size() << " bins, " << bin_set->GetQuad().Summary()
                  << std::endl;
    }

    lru_.push_front(id);
    cache_.emplace(id, Entry(bin_set, lru_.begin()));
    if (capacity_ > 0 && cache_.size() > capacity_)
    {
        cache_.erase(lru_.back());
        lru_.pop_back();
    }
    return bin_set;
}

std::shared_ptr<const BinSet> BinSetRegistry::FromNodeDataset(const LabeledDataset &ds)
{
    return FromDb(ds.AttrString("bin_set"));
}

std::shared_ptr<const BinSet> BinSetRegistry::Convert(const BinSetLike &value)
{
    if (const auto *id = std::get_if<std::string>(&value))
    {
        return FromDb(*id);
    }
    return std::get<std::shared_ptr<const BinSet>>(value);
}

size_t BinSetRegistry::Size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

bool BinSetRegistry::Contains(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.count(id) > 0;
}

void BinSetRegistry::Clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lru_.clear();
}
}  // namespace ckd
