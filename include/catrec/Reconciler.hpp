/**
 * @file Reconciler.hpp
 * @brief Merge partial observations of one catalog entity
 *
 * Merge rules, applied independently per attribute:
 * - Incoming known value replaces the target value (known or not)
 * - Incoming unknown value leaves the target value alone
 * - invalid is OR-ed and never cleared
 * - tag_groups is all-or-nothing: a non-empty incoming set replaces the
 *   target set wholesale, an empty one is ignored
 *
 * The identity of the target is never changed. Merging is synchronous and
 * not thread-safe: callers serialize all merges into one target (see
 * Catalog for a collection that does this).
 */

#ifndef CATREC_RECONCILER_HPP
#define CATREC_RECONCILER_HPP

#include "catrec/Record.hpp"

#include <vector>

namespace catrec {

/**
 * @brief What to do when target and incoming identities differ
 */
enum class IdentityPolicy {
    /// Log a warning and merge anyway.
    Permissive,
    /// Throw IdentityMismatchError and leave the target untouched.
    Strict,
};

struct MergeOptions {
    IdentityPolicy identity_policy = IdentityPolicy::Permissive;
};

/**
 * @brief Merge the known attributes of @p incoming into @p target
 *
 * @p incoming is never modified. Merging a record into itself is a no-op.
 *
 * @param target Record to complete in place
 * @param incoming Newly observed record
 * @param opts Identity handling
 * @throws IdentityMismatchError if identities differ and the policy is Strict
 *
 * Example:
 * ```cpp
 * Record target(1, "c219d2cf41");
 * Record incoming(1, "c219d2cf41");
 * incoming.rating = 4.5f;
 * incoming.tag_groups.set("artist", {"x"});
 * merge(target, incoming);
 * // target.rating == 4.5, target.pages still unknown,
 * // target.tag_groups == {"artist": ["x"]}
 * ```
 */
void merge(Record& target, const Record& incoming, const MergeOptions& opts = {});

/**
 * @brief Merge from an optional record; nullptr is a no-op
 */
void merge(Record& target, const Record* incoming, const MergeOptions& opts = {});

/**
 * @brief Merge the first candidate sharing @p target's identity
 *
 * Candidates are scanned in order and at most one merge happens; later
 * matches are ignored. Finding no match is not an error.
 *
 * @return true if a candidate was merged
 */
bool merge_first_match(Record& target, const std::vector<Record>& candidates,
                       const MergeOptions& opts = {});

/**
 * @brief Same scan over a list that may be absent or contain absent entries
 *
 * A null list and null entries are skipped.
 */
bool merge_first_match(Record& target, const std::vector<const Record*>* candidates,
                       const MergeOptions& opts = {});

/**
 * @brief Clone-then-replace form of merge()
 *
 * ```cpp
 * Record updated = merged(current, observed);
 * ```
 */
Record merged(Record target, const Record& incoming, const MergeOptions& opts = {});

} // namespace catrec

#endif // CATREC_RECONCILER_HPP
