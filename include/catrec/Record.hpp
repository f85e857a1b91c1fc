/**
 * @file Record.hpp
 * @brief Catalog record: one entity as currently known
 *
 * A Record is assembled from several sources (list pages, detail pages,
 * metadata API), none of which can fill every field. Each attribute that a
 * source may fail to observe is a Known<T>; an empty Known<T> means the
 * value was never observed.
 */

#ifndef CATREC_RECORD_HPP
#define CATREC_RECORD_HPP

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace catrec {

/**
 * @brief Attribute that may not have been observed yet
 */
template <typename T>
using Known = std::optional<T>;

/**
 * @brief Check whether an attribute holds real data
 *
 * Engaged optionals are known, with two refinements: an empty string and a
 * NaN float carry no information and count as unknown.
 */
template <typename T>
bool is_known(const Known<T>& v) {
    return v.has_value();
}

inline bool is_known(const Known<std::string>& v) {
    return v.has_value() && !v->empty();
}

inline bool is_known(const Known<float>& v) {
    return v.has_value() && !std::isnan(*v);
}

// ============================================================================
// Enumerations
// ============================================================================

enum class Category : int {
    Misc = 0x1,
    Doujinshi = 0x2,
    Manga = 0x4,
    ArtistCg = 0x8,
    GameCg = 0x10,
    ImageSet = 0x20,
    Cosplay = 0x40,
    AsianPorn = 0x80,
    NonH = 0x100,
    Western = 0x200,
    Private = 0x400,
};

/// Integer that legacy encodings use for an unknown category.
constexpr int kLegacyUnknownCategory = 0x800;

enum class Language : int {
    Japanese = 0,
    English,
    Chinese,
    Dutch,
    French,
    German,
    Hungarian,
    Italian,
    Korean,
    Polish,
    Portuguese,
    Russian,
    Spanish,
    Thai,
    Vietnamese,
};

/// Integer that legacy encodings use for an unknown language.
constexpr int kLegacyUnknownLanguage = -1;

std::string to_string(Category c);
std::string to_string(Language l);

/// Category from its integer code; nullopt for the legacy sentinel or any unassigned code.
Known<Category> category_from_code(int code);
Known<Language> language_from_code(int code);

/// Case-insensitive name lookup ("artist cg", "western", ...).
Known<Category> category_from_string(const std::string& name);
Known<Language> language_from_string(const std::string& name);

// ============================================================================
// Identity
// ============================================================================

/**
 * @brief (id, token) pair naming one entity across all sources
 *
 * Tokens compare by exact, case-sensitive value.
 */
struct Identity {
    std::int64_t id = 0;
    std::string token;

    friend bool operator==(const Identity& a, const Identity& b) {
        return a.id == b.id && a.token == b.token;
    }
    friend bool operator!=(const Identity& a, const Identity& b) {
        return !(a == b);
    }
};

/// "id/token", used in diagnostics.
std::string to_string(const Identity& identity);

// ============================================================================
// Tag groups
// ============================================================================

/**
 * @brief Ordered mapping from group name to ordered tag list
 *
 * Groups keep their first insertion position; keys are unique. Copies are
 * deep, so two TagGroups never share storage.
 */
class TagGroups {
public:
    using Tags = std::vector<std::string>;
    using Entry = std::pair<std::string, Tags>;
    using const_iterator = std::vector<Entry>::const_iterator;

    TagGroups() = default;
    TagGroups(std::initializer_list<Entry> entries);

    /// Replace the tags of @p group, appending the group if it is new.
    void set(const std::string& group, Tags tags);

    /// Append one tag to @p group, creating the group if needed. Duplicate tags are ignored.
    void add(const std::string& group, const std::string& tag);

    /// Tags of @p group, or nullptr if absent.
    const Tags* find(const std::string& group) const;

    bool contains(const std::string& group) const { return find(group) != nullptr; }
    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }
    void clear() noexcept { entries_.clear(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    friend bool operator==(const TagGroups& a, const TagGroups& b) {
        return a.entries_ == b.entries_;
    }
    friend bool operator!=(const TagGroups& a, const TagGroups& b) {
        return !(a == b);
    }

private:
    std::vector<Entry> entries_;
};

// ============================================================================
// Record
// ============================================================================

/**
 * @brief One catalog entity as currently known
 *
 * The identity is fixed by the constructor. Every other attribute starts
 * unknown, invalid starts false and tag_groups starts empty. At least one of
 * title / title_jpn is expected to be known once a producer is done with the
 * record, but nothing here enforces it.
 */
class Record {
public:
    Record(std::int64_t id, std::string token)
        : id_(id)
        , token_(std::move(token))
    {}

    std::int64_t id() const noexcept { return id_; }
    const std::string& token() const noexcept { return token_; }
    Identity identity() const { return Identity{id_, token_}; }

    /// Same id and same token; no other attribute participates.
    bool same_entity(const Record& other) const noexcept {
        return id_ == other.id_ && token_ == other.token_;
    }

    Known<std::string> title;
    Known<std::string> title_jpn;
    /// "[sha1]-[size]-[width]-[height]-[format]", opaque here.
    Known<std::string> cover;
    Known<std::string> cover_url;
    /// Cover width / cover height.
    Known<float> cover_ratio;
    Known<Category> category;
    /// Seconds since epoch.
    Known<std::int64_t> posted;
    Known<std::string> uploader;
    /// [0.5, 5.0]
    Known<float> rating;
    Known<Language> language;
    /// [0, 9]; unknown also means not favorited.
    Known<int> favorite_slot;
    /// Expunged, deleted or replaced. Never reverts once set by a merge.
    bool invalid = false;
    Known<std::string> archive_key;
    Known<int> pages;
    Known<std::int64_t> size;
    Known<int> torrent_count;
    TagGroups tag_groups;

    friend bool operator==(const Record& a, const Record& b);
    friend bool operator!=(const Record& a, const Record& b) { return !(a == b); }

private:
    std::int64_t id_;
    std::string token_;
};

// ============================================================================
// Validation
// ============================================================================

bool is_valid_token(const std::string& token);
bool is_valid_cover_fingerprint(const std::string& cover);
bool is_valid_rating(float rating);
bool is_valid_favorite_slot(int slot);

} // namespace catrec

#endif // CATREC_RECORD_HPP
