/**
 * @file Record.cpp
 * @brief Record helpers: enum names, tag groups, equality, validation
 */

#include "catrec/Record.hpp"
#include "catrec/Util.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace catrec {

namespace {

struct CategoryName {
    Category value;
    const char* name;
};

constexpr std::array<CategoryName, 11> kCategoryNames{{
    {Category::Misc, "Misc"},
    {Category::Doujinshi, "Doujinshi"},
    {Category::Manga, "Manga"},
    {Category::ArtistCg, "Artist CG"},
    {Category::GameCg, "Game CG"},
    {Category::ImageSet, "Image Set"},
    {Category::Cosplay, "Cosplay"},
    {Category::AsianPorn, "Asian Porn"},
    {Category::NonH, "Non-H"},
    {Category::Western, "Western"},
    {Category::Private, "Private"},
}};

constexpr std::array<const char*, 15> kLanguageNames{{
    "Japanese", "English", "Chinese", "Dutch", "French",
    "German", "Hungarian", "Italian", "Korean", "Polish",
    "Portuguese", "Russian", "Spanish", "Thai", "Vietnamese",
}};

// Both unknown compares equal, so NaN placeholders do not break equality.
template <typename T>
bool same_value(const Known<T>& a, const Known<T>& b) {
    const bool ka = is_known(a);
    const bool kb = is_known(b);
    if (ka != kb) return false;
    return !ka || *a == *b;
}

} // anonymous namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string to_string(Category c) {
    for (const auto& entry : kCategoryNames) {
        if (entry.value == c) return entry.name;
    }
    return "Unknown";
}

std::string to_string(Language l) {
    const auto idx = static_cast<std::size_t>(l);
    if (idx < kLanguageNames.size()) return kLanguageNames[idx];
    return "Unknown";
}

Known<Category> category_from_code(int code) {
    for (const auto& entry : kCategoryNames) {
        if (static_cast<int>(entry.value) == code) return entry.value;
    }
    return std::nullopt;
}

Known<Language> language_from_code(int code) {
    if (code < 0 || code >= static_cast<int>(kLanguageNames.size())) {
        return std::nullopt;
    }
    return static_cast<Language>(code);
}

Known<Category> category_from_string(const std::string& name) {
    const std::string wanted = to_lower(name);
    for (const auto& entry : kCategoryNames) {
        if (to_lower(entry.name) == wanted) return entry.value;
    }
    return std::nullopt;
}

Known<Language> language_from_string(const std::string& name) {
    const std::string wanted = to_lower(name);
    for (std::size_t i = 0; i < kLanguageNames.size(); ++i) {
        if (to_lower(kLanguageNames[i]) == wanted) return static_cast<Language>(i);
    }
    return std::nullopt;
}

std::string to_string(const Identity& identity) {
    return std::to_string(identity.id) + "/" + identity.token;
}

// ============================================================================
// TagGroups
// ============================================================================

TagGroups::TagGroups(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void TagGroups::set(const std::string& group, Tags tags) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == group; });
    if (it != entries_.end()) {
        it->second = std::move(tags);
    } else {
        entries_.emplace_back(group, std::move(tags));
    }
}

void TagGroups::add(const std::string& group, const std::string& tag) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == group; });
    if (it == entries_.end()) {
        entries_.emplace_back(group, Tags{tag});
        return;
    }
    if (std::find(it->second.begin(), it->second.end(), tag) == it->second.end()) {
        it->second.push_back(tag);
    }
}

const TagGroups::Tags* TagGroups::find(const std::string& group) const {
    for (const auto& entry : entries_) {
        if (entry.first == group) return &entry.second;
    }
    return nullptr;
}

// ============================================================================
// Record
// ============================================================================

bool operator==(const Record& a, const Record& b) {
    return a.same_entity(b)
        && same_value(a.title, b.title)
        && same_value(a.title_jpn, b.title_jpn)
        && same_value(a.cover, b.cover)
        && same_value(a.cover_url, b.cover_url)
        && same_value(a.cover_ratio, b.cover_ratio)
        && same_value(a.category, b.category)
        && same_value(a.posted, b.posted)
        && same_value(a.uploader, b.uploader)
        && same_value(a.rating, b.rating)
        && same_value(a.language, b.language)
        && same_value(a.favorite_slot, b.favorite_slot)
        && a.invalid == b.invalid
        && same_value(a.archive_key, b.archive_key)
        && same_value(a.pages, b.pages)
        && same_value(a.size, b.size)
        && same_value(a.torrent_count, b.torrent_count)
        && a.tag_groups == b.tag_groups;
}

// ============================================================================
// Validation
// ============================================================================

bool is_valid_token(const std::string& token) {
    static const std::regex re("[0-9a-f]{10}");
    return std::regex_match(token, re);
}

bool is_valid_cover_fingerprint(const std::string& cover) {
    static const std::regex re("[0-9a-f]{40}-\\d+-\\d+-\\d+-[0-9a-z]+");
    return std::regex_match(cover, re);
}

bool is_valid_rating(float rating) {
    return rating >= 0.5f && rating <= 5.0f;
}

bool is_valid_favorite_slot(int slot) {
    return slot >= 0 && slot <= 9;
}

} // namespace catrec
