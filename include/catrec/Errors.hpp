/**
 * @file Errors.hpp
 * @brief Exception types for catrec
 *
 * Error taxonomy:
 * - CatrecError: Base class
 * - IdentityMismatchError: Strict merge of records with different identities
 * - RecordFormatError: Encoded record is malformed or out of range
 * - FileNotFoundError: Store or settings file not found
 * - StoreParseError: Store file is not valid JSON
 * - StoreWriteError: Store file could not be written
 * - SettingsError: Invalid configuration value
 *
 * A permissive merge never throws.
 */

#ifndef CATREC_ERRORS_HPP
#define CATREC_ERRORS_HPP

#include "catrec/Record.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace catrec {

/**
 * @brief Base class for all catrec exceptions
 */
class CatrecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Target and incoming record describe different entities
 *
 * Only raised when MergeOptions::identity_policy is Strict. The target
 * record is left untouched when this is thrown.
 */
class IdentityMismatchError : public CatrecError {
public:
    IdentityMismatchError(Identity target, Identity incoming)
        : CatrecError("Cannot merge record " + to_string(incoming) +
                      " into record " + to_string(target))
        , target_(std::move(target))
        , incoming_(std::move(incoming))
    {}

    const Identity& target() const noexcept {
        return target_;
    }

    const Identity& incoming() const noexcept {
        return incoming_;
    }

private:
    Identity target_;
    Identity incoming_;
};

/**
 * @brief Encoded record could not be decoded
 */
class RecordFormatError : public CatrecError {
public:
    /**
     * @param field Offending key (empty for document-level problems)
     * @param details What was wrong with it
     */
    RecordFormatError(std::string field, std::string details)
        : CatrecError(field.empty()
                      ? "Malformed record document: " + details
                      : "Malformed record field '" + field + "': " + details)
        , field_(std::move(field))
        , details_(std::move(details))
    {}

    const std::string& field() const noexcept {
        return field_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string field_;
    std::string details_;
};

/**
 * @brief Store or settings file not found
 */
class FileNotFoundError : public CatrecError {
public:
    explicit FileNotFoundError(std::string path)
        : CatrecError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Store file exists but is not valid JSON
 */
class StoreParseError : public CatrecError {
public:
    StoreParseError(std::string file, std::string details)
        : CatrecError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Store file could not be serialized or written
 *
 * The file at path() is unchanged when this is thrown.
 */
class StoreWriteError : public CatrecError {
public:
    StoreWriteError(std::string path, std::string details)
        : CatrecError("Failed to write store file '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Configuration key holds an unusable value
 */
class SettingsError : public CatrecError {
public:
    SettingsError(std::string key, std::string details)
        : CatrecError("Invalid setting '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

} // namespace catrec

#endif // CATREC_ERRORS_HPP
