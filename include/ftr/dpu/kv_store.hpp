#pragma once

#include "ftr/core/result.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ftr::dpu {

/// Field name -> value of one table entry
using FieldMap = std::map<std::string, std::string>;

/**
 * @brief Read side of a hash-per-key store (cluster state and config tables)
 *
 * get_all() returns std::nullopt for a missing key; an error means the
 * store itself could not be read.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual Result<std::optional<FieldMap>> get_all(const std::string& key) const = 0;
};

/**
 * @brief In-process store, safe for concurrent readers and writers
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    Result<std::optional<FieldMap>> get_all(const std::string& key) const override;

    void put(const std::string& key, FieldMap fields);
    void set_field(const std::string& key, const std::string& field, const std::string& value);
    void erase(const std::string& key);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FieldMap> entries_;
};

/**
 * @brief Store backed by a JSON document of the form
 *
 * ```json
 * { "CHASSIS_MIDPLANE_TABLE|DPU0": { "ip_address": "169.254.200.1", "access": "True" } }
 * ```
 *
 * The file is re-read on every call, so edits are visible immediately.
 * Non-string field values (numbers, booleans) are returned in their JSON
 * text form.
 */
class JsonFileKeyValueStore : public KeyValueStore {
public:
    explicit JsonFileKeyValueStore(std::string path);

    Result<std::optional<FieldMap>> get_all(const std::string& key) const override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace ftr::dpu
