/**
 * @file Codec.cpp
 * @brief JSON encoding of records
 */

#include "catrec/Codec.hpp"
#include "catrec/Errors.hpp"

#include <limits>

namespace catrec {

using nlohmann::ordered_json;

namespace {

// ============================================================================
// Encoding
// ============================================================================

template <typename T>
ordered_json known_to_json(const Known<T>& v) {
    if (!is_known(v)) return nullptr;
    return ordered_json(*v);
}

template <typename E>
ordered_json known_enum_to_json(const Known<E>& v) {
    if (!is_known(v)) return nullptr;
    return ordered_json(static_cast<int>(*v));
}

// ============================================================================
// Decoding
// ============================================================================

// Value for key, or nullptr when the key is missing or null.
const ordered_json* find_value(const ordered_json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &(*it);
}

Known<std::string> read_string(const ordered_json& j, const char* key) {
    const ordered_json* v = find_value(j, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) {
        throw RecordFormatError(key, "expected a string, got " + std::string(v->type_name()));
    }
    std::string s = v->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

Known<std::int64_t> read_int64(const ordered_json& j, const char* key) {
    const ordered_json* v = find_value(j, key);
    if (!v) return std::nullopt;
    if (!v->is_number_integer()) {
        throw RecordFormatError(key, "expected an integer, got " + std::string(v->type_name()));
    }
    if (v->is_number_unsigned() &&
        v->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw RecordFormatError(key, "integer out of range");
    }
    return v->get<std::int64_t>();
}

Known<int> read_int(const ordered_json& j, const char* key) {
    Known<std::int64_t> wide = read_int64(j, key);
    if (!wide) return std::nullopt;
    if (*wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max()) {
        throw RecordFormatError(key, "integer out of range");
    }
    return static_cast<int>(*wide);
}

Known<float> read_float(const ordered_json& j, const char* key) {
    const ordered_json* v = find_value(j, key);
    if (!v) return std::nullopt;
    if (!v->is_number()) {
        throw RecordFormatError(key, "expected a number, got " + std::string(v->type_name()));
    }
    return static_cast<float>(v->get<double>());
}

// Drops the value when it equals the legacy sentinel of a version 1 document.
template <typename T>
Known<T> drop_sentinel(Known<T> v, int version, T sentinel) {
    if (version == kLegacySchemaVersion && v && *v == sentinel) return std::nullopt;
    return v;
}

void require_non_negative(const Known<std::int64_t>& v, const char* key) {
    if (v && *v < 0) throw RecordFormatError(key, "must not be negative");
}

void require_non_negative(const Known<int>& v, const char* key) {
    if (v && *v < 0) throw RecordFormatError(key, "must not be negative");
}

Known<Category> read_category(const ordered_json& j, int version) {
    const ordered_json* v = find_value(j, "category");
    if (v && v->is_string()) {
        Known<Category> named = category_from_string(v->get<std::string>());
        if (!named) throw RecordFormatError("category", "unknown name '" + v->get<std::string>() + "'");
        return named;
    }
    Known<int> code = drop_sentinel(read_int(j, "category"), version, kLegacyUnknownCategory);
    if (!code) return std::nullopt;
    Known<Category> c = category_from_code(*code);
    if (!c) throw RecordFormatError("category", "unassigned code " + std::to_string(*code));
    return c;
}

Known<Language> read_language(const ordered_json& j, int version) {
    const ordered_json* v = find_value(j, "language");
    if (v && v->is_string()) {
        Known<Language> named = language_from_string(v->get<std::string>());
        if (!named) throw RecordFormatError("language", "unknown name '" + v->get<std::string>() + "'");
        return named;
    }
    Known<int> code = drop_sentinel(read_int(j, "language"), version, kLegacyUnknownLanguage);
    if (!code) return std::nullopt;
    Known<Language> l = language_from_code(*code);
    if (!l) throw RecordFormatError("language", "unassigned code " + std::to_string(*code));
    return l;
}

TagGroups read_tags(const ordered_json& j) {
    TagGroups groups;
    const ordered_json* v = find_value(j, "tags");
    if (!v) return groups;
    if (!v->is_object()) {
        throw RecordFormatError("tags", "expected an object, got " + std::string(v->type_name()));
    }
    for (auto it = v->begin(); it != v->end(); ++it) {
        if (!it.value().is_array()) {
            throw RecordFormatError("tags", "group '" + it.key() + "' is not an array");
        }
        TagGroups::Tags tags;
        for (const auto& tag : it.value()) {
            if (!tag.is_string()) {
                throw RecordFormatError("tags", "group '" + it.key() + "' holds a non-string tag");
            }
            tags.push_back(tag.get<std::string>());
        }
        groups.set(it.key(), std::move(tags));
    }
    return groups;
}

} // anonymous namespace

ordered_json to_json(const Record& record) {
    ordered_json tags = ordered_json::object();
    for (const auto& [group, values] : record.tag_groups) {
        tags[group] = values;
    }

    return ordered_json{
        {"id", record.id()},
        {"token", record.token()},
        {"title", known_to_json(record.title)},
        {"title_jpn", known_to_json(record.title_jpn)},
        {"cover", known_to_json(record.cover)},
        {"cover_url", known_to_json(record.cover_url)},
        {"cover_ratio", known_to_json(record.cover_ratio)},
        {"category", known_enum_to_json(record.category)},
        {"posted", known_to_json(record.posted)},
        {"uploader", known_to_json(record.uploader)},
        {"rating", known_to_json(record.rating)},
        {"language", known_enum_to_json(record.language)},
        {"favorite_slot", known_to_json(record.favorite_slot)},
        {"invalid", record.invalid},
        {"archive_key", known_to_json(record.archive_key)},
        {"pages", known_to_json(record.pages)},
        {"size", known_to_json(record.size)},
        {"torrent_count", known_to_json(record.torrent_count)},
        {"tags", tags},
    };
}

Record record_from_json(const ordered_json& j, int version) {
    if (!j.is_object()) {
        throw RecordFormatError("", "record is not an object");
    }

    Known<std::int64_t> id = read_int64(j, "id");
    if (!id) throw RecordFormatError("id", "missing");
    Known<std::string> token = read_string(j, "token");
    if (!token) throw RecordFormatError("token", "missing");
    if (!is_valid_token(*token)) {
        throw RecordFormatError("token", "'" + *token + "' is not 10 lowercase hex digits");
    }

    Record r(*id, *token);
    r.title = read_string(j, "title");
    r.title_jpn = read_string(j, "title_jpn");
    r.cover = read_string(j, "cover");
    if (r.cover && !is_valid_cover_fingerprint(*r.cover)) {
        throw RecordFormatError("cover", "'" + *r.cover + "' is not a cover fingerprint");
    }
    r.cover_url = read_string(j, "cover_url");
    r.cover_ratio = read_float(j, "cover_ratio");
    r.category = read_category(j, version);
    r.posted = drop_sentinel<std::int64_t>(read_int64(j, "posted"), version, 0);
    r.uploader = read_string(j, "uploader");

    r.rating = read_float(j, "rating");
    if (r.rating && !is_valid_rating(*r.rating)) {
        throw RecordFormatError("rating", "must be within [0.5, 5]");
    }

    r.language = read_language(j, version);

    r.favorite_slot = drop_sentinel(read_int(j, "favorite_slot"), version, -1);
    if (r.favorite_slot && !is_valid_favorite_slot(*r.favorite_slot)) {
        throw RecordFormatError("favorite_slot", "must be within [0, 9]");
    }

    if (const ordered_json* invalid = find_value(j, "invalid")) {
        if (!invalid->is_boolean()) {
            throw RecordFormatError("invalid", "expected a boolean, got " + std::string(invalid->type_name()));
        }
        r.invalid = invalid->get<bool>();
    }

    r.archive_key = read_string(j, "archive_key");

    r.pages = drop_sentinel(read_int(j, "pages"), version, -1);
    require_non_negative(r.pages, "pages");
    r.size = drop_sentinel<std::int64_t>(read_int64(j, "size"), version, -1);
    require_non_negative(r.size, "size");
    r.torrent_count = drop_sentinel(read_int(j, "torrent_count"), version, 0);
    require_non_negative(r.torrent_count, "torrent_count");

    r.tag_groups = read_tags(j);
    return r;
}

ordered_json encode_document(const std::vector<Record>& records) {
    ordered_json items = ordered_json::array();
    for (const auto& r : records) {
        items.push_back(to_json(r));
    }
    return ordered_json{
        {"name", kDocumentName},
        {"version", kSchemaVersion},
        {"items", std::move(items)},
    };
}

std::vector<Record> decode_document(const ordered_json& doc) {
    if (!doc.is_object()) {
        throw RecordFormatError("", "document is not an object");
    }

    auto name = doc.find("name");
    if (name == doc.end() || !name->is_string() || name->get<std::string>() != kDocumentName) {
        throw RecordFormatError("name", std::string("expected '") + kDocumentName + "'");
    }

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer()) {
        throw RecordFormatError("version", "missing");
    }
    if (version->is_number_unsigned() &&
        version->get<std::uint64_t>() > static_cast<std::uint64_t>(kSchemaVersion)) {
        throw RecordFormatError("version", "unsupported version " + version->dump());
    }
    const std::int64_t wide = version->get<std::int64_t>();
    if (wide != kLegacySchemaVersion && wide != kSchemaVersion) {
        throw RecordFormatError("version", "unsupported version " + std::to_string(wide));
    }
    const int v = static_cast<int>(wide);

    std::vector<Record> records;
    auto items = doc.find("items");
    if (items == doc.end() || items->is_null()) {
        return records;
    }
    if (!items->is_array()) {
        throw RecordFormatError("items", "expected an array");
    }
    records.reserve(items->size());
    for (const auto& item : *items) {
        records.push_back(record_from_json(item, v));
    }
    return records;
}

} // namespace catrec
