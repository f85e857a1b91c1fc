/**
 * @file Reconciler.cpp
 * @brief Implementation of record merging
 */

#include "catrec/Reconciler.hpp"
#include "catrec/Errors.hpp"
#include "catrec/Logging.hpp"

namespace catrec {

namespace {

template <typename T>
void merge_field(Known<T>& dst, const Known<T>& src) {
    if (is_known(src)) {
        dst = src;
    }
}

void check_identity(const Record& target, const Record& incoming, const MergeOptions& opts) {
    if (target.same_entity(incoming)) {
        return;
    }
    if (opts.identity_policy == IdentityPolicy::Strict) {
        throw IdentityMismatchError(target.identity(), incoming.identity());
    }
    CATREC_LOG_WARN("Merging records with different identities",
                    {IntField("target_id", target.id()),
                     StringField("target_token", target.token()),
                     IntField("incoming_id", incoming.id()),
                     StringField("incoming_token", incoming.token())});
}

} // anonymous namespace

void merge(Record& target, const Record& incoming, const MergeOptions& opts) {
    if (&target == &incoming) {
        return;
    }

    // Must run before any field is touched so a strict failure leaves target intact
    check_identity(target, incoming, opts);

    merge_field(target.title, incoming.title);
    merge_field(target.title_jpn, incoming.title_jpn);
    merge_field(target.cover, incoming.cover);
    merge_field(target.cover_url, incoming.cover_url);
    merge_field(target.cover_ratio, incoming.cover_ratio);
    merge_field(target.category, incoming.category);
    merge_field(target.posted, incoming.posted);
    merge_field(target.uploader, incoming.uploader);
    merge_field(target.rating, incoming.rating);
    merge_field(target.language, incoming.language);
    merge_field(target.favorite_slot, incoming.favorite_slot);
    if (incoming.invalid) {
        target.invalid = true;
    }
    merge_field(target.archive_key, incoming.archive_key);
    merge_field(target.pages, incoming.pages);
    merge_field(target.size, incoming.size);
    merge_field(target.torrent_count, incoming.torrent_count);
    if (!incoming.tag_groups.empty()) {
        target.tag_groups = incoming.tag_groups;
    }
}

void merge(Record& target, const Record* incoming, const MergeOptions& opts) {
    if (incoming == nullptr) {
        return;
    }
    merge(target, *incoming, opts);
}

bool merge_first_match(Record& target, const std::vector<Record>& candidates,
                       const MergeOptions& opts) {
    for (const auto& candidate : candidates) {
        if (candidate.same_entity(target)) {
            merge(target, candidate, opts);
            return true;
        }
    }
    return false;
}

bool merge_first_match(Record& target, const std::vector<const Record*>* candidates,
                       const MergeOptions& opts) {
    if (candidates == nullptr) {
        return false;
    }
    for (const Record* candidate : *candidates) {
        if (candidate != nullptr && candidate->same_entity(target)) {
            merge(target, *candidate, opts);
            return true;
        }
    }
    return false;
}

Record merged(Record target, const Record& incoming, const MergeOptions& opts) {
    merge(target, incoming, opts);
    return target;
}

} // namespace catrec
