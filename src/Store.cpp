#include "catrec/Store.hpp"
#include "catrec/Codec.hpp"
#include "catrec/Errors.hpp"
#include "catrec/Logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace catrec {

std::vector<Record> load_store_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();

    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreParseError(path, e.what());
    }

    std::vector<Record> records = decode_document(doc);
    CATREC_LOG_INFO("Loaded store", {StringField("path", path),
                                     IntField("records", static_cast<std::int64_t>(records.size()))});
    return records;
}

void save_store_file(const std::string& path, const std::vector<Record>& records) {
    // Serialize before touching the filesystem; a record that cannot be
    // written (invalid UTF-8 text) must leave the previous store in place.
    std::string text;
    try {
        text = encode_document(records).dump(2);
    } catch (const nlohmann::json::type_error& e) {
        throw StoreWriteError(path, e.what());
    }
    text += "\n";

    const std::string tmp = path + ".tmp";
    std::error_code ec;
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw StoreWriteError(path, "cannot open " + tmp);
        }
        ofs << text;
        ofs.close();
        if (!ofs) {
            fs::remove(tmp, ec);
            throw StoreWriteError(path, "short write to " + tmp);
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw StoreWriteError(path, reason);
    }
    CATREC_LOG_INFO("Saved store", {StringField("path", path),
                                    IntField("records", static_cast<std::int64_t>(records.size()))});
}

} // namespace catrec
