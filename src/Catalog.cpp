#include "catrec/Catalog.hpp"

#include <mutex>

namespace catrec {

std::string Catalog::Key(const Identity& identity) {
    return to_string(identity);
}

// ------------------------------------------------------------
// Upsert
// ------------------------------------------------------------

bool Catalog::upsert(const Record& record) {
    std::unique_lock lock(mutex_);

    const auto key = Key(record.identity());
    auto it = index_.find(key);
    if (it == index_.end()) {
        index_.emplace(key, records_.size());
        records_.push_back(record);
        return false;
    }

    merge(records_[it->second], record, opts_);
    return true;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::optional<Record> Catalog::find(const Identity& identity) const {
    std::shared_lock lock(mutex_);
    auto it = index_.find(Key(identity));
    if (it == index_.end())
        return std::nullopt;
    return records_[it->second];
}

bool Catalog::contains(const Identity& identity) const {
    std::shared_lock lock(mutex_);
    return index_.count(Key(identity)) > 0;
}

std::size_t Catalog::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

std::vector<Record> Catalog::snapshot() const {
    std::shared_lock lock(mutex_);
    return records_;
}

// ------------------------------------------------------------
// Erase
// ------------------------------------------------------------

bool Catalog::erase(const Identity& identity) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(Key(identity));
    if (it == index_.end())
        return false;

    const std::size_t pos = it->second;
    index_.erase(it);
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(pos));
    for (auto& [key, idx] : index_) {
        if (idx > pos)
            --idx;
    }
    return true;
}

} // namespace catrec
