/**
 * @file Catalog.hpp
 * @brief Owning, identity-keyed record collection
 *
 * The catalog is the single owner of its records. Every merge into a stored
 * record happens under the catalog lock, so concurrent upserts of the same
 * entity are serialized and each one sees the result of the previous one.
 * Reads return copies.
 */

#ifndef CATREC_CATALOG_HPP
#define CATREC_CATALOG_HPP

#include "catrec/Reconciler.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace catrec {

class Catalog {
public:
    explicit Catalog(MergeOptions opts = {}) : opts_(opts) {}

    /**
     * @brief Merge @p record into the stored record with the same identity,
     *        or store a copy if there is none.
     * @return true if an existing record was merged
     */
    bool upsert(const Record& record);

    std::optional<Record> find(const Identity& identity) const;
    bool contains(const Identity& identity) const;
    bool erase(const Identity& identity);
    std::size_t size() const;

    /// Copies of all records, in first-insertion order.
    std::vector<Record> snapshot() const;

private:
    static std::string Key(const Identity& identity);

    MergeOptions opts_;
    mutable std::shared_mutex mutex_;
    std::vector<Record> records_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace catrec

#endif // CATREC_CATALOG_HPP
