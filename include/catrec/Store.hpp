/**
 * @file Store.hpp
 * @brief Record store files
 *
 * A store file holds one Codec document. Writes go to a sibling temporary
 * file that is renamed over the target, so a failed write leaves the old
 * store in place.
 */

#ifndef CATREC_STORE_HPP
#define CATREC_STORE_HPP

#include "catrec/Record.hpp"

#include <string>
#include <vector>

namespace catrec {

/**
 * @brief Load every record from a store file.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws StoreParseError if the file is not valid JSON
 * @throws RecordFormatError if the document or a record is malformed
 */
std::vector<Record> load_store_file(const std::string& path);

/**
 * @brief Write records to a store file, replacing it.
 *
 * @throws StoreWriteError if a record cannot be serialized or the file cannot
 *         be written; the existing file is left unchanged
 */
void save_store_file(const std::string& path, const std::vector<Record>& records);

} // namespace catrec

#endif // CATREC_STORE_HPP
