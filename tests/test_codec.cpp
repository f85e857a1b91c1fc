/**
 * @file test_codec.cpp
 * @brief Tests for the JSON record encoding
 */

#include <gtest/gtest.h>
#include "catrec/Codec.hpp"
#include "catrec/Errors.hpp"
#include "TestHelpers.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

using namespace catrec;
using namespace catrec_test;
using nlohmann::ordered_json;

// ============================================================================
// Encoding
// ============================================================================

TEST(Codec, UnknownIsWrittenAsNull) {
    ordered_json j = to_json(Record(1, kToken));
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["token"], kToken);
    EXPECT_TRUE(j["title"].is_null());
    EXPECT_TRUE(j["rating"].is_null());
    EXPECT_TRUE(j["pages"].is_null());
    EXPECT_TRUE(j["torrent_count"].is_null());
    EXPECT_EQ(j["invalid"], false);
    EXPECT_TRUE(j["tags"].is_object());
    EXPECT_TRUE(j["tags"].empty());
}

TEST(Codec, NaNIsWrittenAsNull) {
    Record r(1, kToken);
    r.cover_ratio = std::nanf("");
    EXPECT_TRUE(to_json(r)["cover_ratio"].is_null());
}

TEST(Codec, TagOrderSurvivesRoundTrip) {
    Record r(1, kToken);
    r.tag_groups.set("parody", {"p"});
    r.tag_groups.set("artist", {"b", "a"});

    const std::string text = to_json(r).dump();
    EXPECT_LT(text.find("parody"), text.find("artist"));

    Record back = record_from_json(ordered_json::parse(text));
    EXPECT_EQ(back.tag_groups, r.tag_groups);
}

TEST(Codec, FullRecordRoundTripsExactly) {
    Record r = full_record();
    r.invalid = true;
    r.torrent_count = 0;

    const std::string text = encode_document({r}).dump();
    std::vector<Record> back = decode_document(ordered_json::parse(text));

    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0], r);
    EXPECT_EQ(*back[0].cover_ratio, *r.cover_ratio);
    ASSERT_TRUE(is_known(back[0].torrent_count));
    EXPECT_EQ(*back[0].torrent_count, 0);
}

TEST(Codec, DocumentHeader) {
    ordered_json doc = encode_document({});
    EXPECT_EQ(doc["name"], kDocumentName);
    EXPECT_EQ(doc["version"], kSchemaVersion);
    EXPECT_TRUE(doc["items"].is_array());
    EXPECT_EQ(doc.begin().key(), "name");
}

// ============================================================================
// Decoding
// ============================================================================

TEST(Codec, MissingKeysAreUnknown) {
    Record r = record_from_json(ordered_json{{"id", 5}, {"token", kToken}});
    EXPECT_EQ(r, Record(5, kToken));
}

TEST(Codec, CategoryAndLanguageByName) {
    Record r = record_from_json(ordered_json{
        {"id", 5}, {"token", kToken}, {"category", "Game CG"}, {"language", "korean"}});
    EXPECT_EQ(*r.category, Category::GameCg);
    EXPECT_EQ(*r.language, Language::Korean);
}

TEST(Codec, CurrentVersionReadsSentinelLookalikesLiterally) {
    Record r = record_from_json(ordered_json{
        {"id", 5}, {"token", kToken}, {"posted", 0}, {"torrent_count", 0}});
    EXPECT_EQ(*r.posted, 0);
    EXPECT_EQ(*r.torrent_count, 0);
}

TEST(Codec, LegacyVersionMapsSentinelsToUnknown) {
    ordered_json doc = {
        {"name", kDocumentName},
        {"version", kLegacySchemaVersion},
        {"items", ordered_json::array({ordered_json{
            {"id", 5},
            {"token", kToken},
            {"title", "t"},
            {"category", kLegacyUnknownCategory},
            {"posted", 0},
            {"language", kLegacyUnknownLanguage},
            {"favorite_slot", -1},
            {"pages", -1},
            {"size", -1},
            {"torrent_count", 0},
            {"rating", nullptr},
        }})},
    };

    std::vector<Record> records = decode_document(doc);
    ASSERT_EQ(records.size(), 1u);
    Record expected(5, kToken);
    expected.title = "t";
    EXPECT_EQ(records[0], expected);
}

TEST(Codec, LegacyVersionKeepsRealValues) {
    ordered_json doc = {
        {"name", kDocumentName},
        {"version", kLegacySchemaVersion},
        {"items", ordered_json::array({ordered_json{
            {"id", 5}, {"token", kToken},
            {"category", 0x2}, {"favorite_slot", 0}, {"pages", 0}, {"torrent_count", 3},
        }})},
    };

    Record r = decode_document(doc).at(0);
    EXPECT_EQ(*r.category, Category::Doujinshi);
    EXPECT_EQ(*r.favorite_slot, 0);
    EXPECT_EQ(*r.pages, 0);
    EXPECT_EQ(*r.torrent_count, 3);
}

// ============================================================================
// Errors
// ============================================================================

TEST(CodecErrors, MissingIdentity) {
    EXPECT_THROW(record_from_json(ordered_json{{"token", kToken}}), RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}}), RecordFormatError);
}

TEST(CodecErrors, InvalidToken) {
    try {
        record_from_json(ordered_json{{"id", 1}, {"token", "not-a-token"}});
        FAIL() << "Expected RecordFormatError";
    } catch (const RecordFormatError& e) {
        EXPECT_EQ(e.field(), "token");
    }
}

TEST(CodecErrors, WrongTypes) {
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"title", 3}}),
                 RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"pages", "many"}}),
                 RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"invalid", 1}}),
                 RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"tags", {{"a", "b"}}}}),
                 RecordFormatError);
}

TEST(CodecErrors, OutOfRange) {
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"rating", 7.0}}),
                 RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"favorite_slot", 10}}),
                 RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"pages", -1}}),
                 RecordFormatError);
    EXPECT_THROW(record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"category", 0x3}}),
                 RecordFormatError);
}

TEST(CodecErrors, BadDocument) {
    EXPECT_THROW(decode_document(ordered_json::array()), RecordFormatError);
    EXPECT_THROW(decode_document(ordered_json{{"name", "other"}, {"version", 2}}), RecordFormatError);
    EXPECT_THROW(decode_document(ordered_json{{"name", kDocumentName}, {"version", 9}}), RecordFormatError);
    EXPECT_THROW(decode_document(ordered_json{{"name", kDocumentName}, {"version", 2}, {"items", 1}}),
                 RecordFormatError);
}

TEST(CodecErrors, MalformedCoverFingerprint) {
    try {
        record_from_json(ordered_json{{"id", 1}, {"token", kToken}, {"cover", "cover.jpg"}});
        FAIL() << "Expected RecordFormatError";
    } catch (const RecordFormatError& e) {
        EXPECT_EQ(e.field(), "cover");
    }

    Record r = record_from_json(ordered_json{
        {"id", 1}, {"token", kToken},
        {"cover", "7dd3e4a62807a6938910a14407d9867b18a58a9f-2333088-2831-4015-jpg"}});
    ASSERT_TRUE(r.cover.has_value());
}

TEST(CodecErrors, VersionOutsideIntRange) {
    // 2^32 + 2 truncates to 2 through a 32-bit read.
    const std::int64_t wide = 4294967298LL;
    try {
        decode_document(ordered_json{{"name", kDocumentName}, {"version", wide}, {"items", ordered_json::array()}});
        FAIL() << "Expected RecordFormatError";
    } catch (const RecordFormatError& e) {
        EXPECT_EQ(e.field(), "version");
    }
    EXPECT_THROW(decode_document(ordered_json{{"name", kDocumentName},
                                              {"version", std::numeric_limits<std::uint64_t>::max()}}),
                 RecordFormatError);
}
