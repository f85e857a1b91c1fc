/**
 * @file Codec.hpp
 * @brief JSON encoding of records (nlohmann::ordered_json)
 *
 * Document layout:
 * ```json
 * {"name": "catrec:Record", "version": 2, "items": [ {...}, ... ]}
 * ```
 *
 * Version 2 writes an unknown attribute as null and reads every non-null
 * value literally. Version 1 is the legacy sentinel encoding and is read
 * only: -1 (favorite_slot, pages, size, language), 0 (posted,
 * torrent_count) and kLegacyUnknownCategory mean unknown there.
 *
 * A missing key always reads as unknown. Tag groups are a JSON object whose
 * key order is the group order.
 */

#ifndef CATREC_CODEC_HPP
#define CATREC_CODEC_HPP

#include "catrec/Record.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace catrec {

constexpr const char* kDocumentName = "catrec:Record";
constexpr int kLegacySchemaVersion = 1;
constexpr int kSchemaVersion = 2;

nlohmann::ordered_json to_json(const Record& record);

/**
 * @brief Decode one record object
 *
 * @param j Record object
 * @param version Schema version of the enclosing document
 * @throws RecordFormatError on a missing identity, invalid token, wrong
 *         value type or out-of-range value
 */
Record record_from_json(const nlohmann::ordered_json& j, int version = kSchemaVersion);

nlohmann::ordered_json encode_document(const std::vector<Record>& records);

/**
 * @brief Decode a full document
 *
 * @throws RecordFormatError if the name or version is not recognized, or any
 *         item fails to decode
 */
std::vector<Record> decode_document(const nlohmann::ordered_json& doc);

} // namespace catrec

#endif // CATREC_CODEC_HPP
