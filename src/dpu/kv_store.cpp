#include "ftr/dpu/kv_store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace ftr::dpu {

using json = nlohmann::json;

// ──────────────────────────────────────────────────────────
// MemoryKeyValueStore
// ──────────────────────────────────────────────────────────

Result<std::optional<FieldMap>> MemoryKeyValueStore::get_all(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Ok(std::optional<FieldMap>());
    }
    return Ok(std::optional<FieldMap>(it->second));
}

void MemoryKeyValueStore::put(const std::string& key, FieldMap fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(fields);
}

void MemoryKeyValueStore::set_field(const std::string& key, const std::string& field,
                                    const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key][field] = value;
}

void MemoryKeyValueStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

// ──────────────────────────────────────────────────────────
// JsonFileKeyValueStore
// ──────────────────────────────────────────────────────────

JsonFileKeyValueStore::JsonFileKeyValueStore(std::string path)
    : path_(std::move(path)) {
}

Result<std::optional<FieldMap>> JsonFileKeyValueStore::get_all(const std::string& key) const {
    using Entry = std::optional<FieldMap>;

    std::ifstream in(path_);
    if (!in) {
        return Fail<Entry>(StatusCode::Internal, "cannot open store " + path_);
    }

    json document;
    try {
        document = json::parse(in);
    } catch (const json::exception& e) {
        return Fail<Entry>(StatusCode::Internal, "malformed store " + path_ + ": " + e.what());
    }

    if (!document.is_object()) {
        return Fail<Entry>(StatusCode::Internal, "store " + path_ + " is not a JSON object");
    }

    auto it = document.find(key);
    if (it == document.end()) {
        return Ok(Entry());
    }
    if (!it->is_object()) {
        return Fail<Entry>(StatusCode::Internal, "entry " + key + " in " + path_ + " is not an object");
    }

    FieldMap fields;
    for (const auto& item : it->items()) {
        const auto& value = item.value();
        fields[item.key()] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return Ok(Entry(std::move(fields)));
}

} // namespace ftr::dpu
