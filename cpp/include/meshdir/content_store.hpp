/**
 * @file content_store.hpp
 * @brief In-memory keyed store of content records
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "meshdir/utilities.hpp"
#include "meshdir/uuid.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshdir {

/**
 * @brief ContentStore - records keyed by their Uuid
 *
 * Record must expose `Uuid id`, `summary()` and a static
 * `list_from_json(const std::string&, size_t*)`.
 *
 * Not thread-safe: accessed only from the owning node's processing context.
 */
template <typename Record>
class ContentStore {
public:
    /**
     * @brief Insert or replace a record
     * @return true if the id was not present before
     */
    bool insert(Record record) {
        Uuid id = record.id;
        auto result = records_.insert_or_assign(id, std::move(record));
        return result.second;
    }

    /**
     * @brief Remove a record
     * @return Removed record, or std::nullopt if absent
     */
    std::optional<Record> remove(const Uuid& id) {
        auto it = records_.find(id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        Record record = std::move(it->second);
        records_.erase(it);
        return record;
    }

    /**
     * @brief Look up a record
     * @return Pointer into the store (valid until the next mutation), or nullptr
     */
    const Record* get(const Uuid& id) const {
        auto it = records_.find(id);
        return it == records_.end() ? nullptr : &it->second;
    }

    bool contains(const Uuid& id) const {
        return records_.find(id) != records_.end();
    }

    /**
     * @brief Sorted "id:title" summaries of every record
     */
    std::vector<std::string> list() const {
        std::vector<std::string> items;
        items.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            items.push_back(record.summary());
        }
        std::sort(items.begin(), items.end());
        return items;
    }

    /**
     * @brief Copy of every record, ordered by id
     */
    std::vector<Record> all() const {
        std::vector<Record> result;
        result.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            result.push_back(record);
        }
        std::sort(result.begin(), result.end(),
                  [](const Record& a, const Record& b) { return a.id < b.id; });
        return result;
    }

    /**
     * @brief Insert every valid record of a JSON array
     * @param json JSON array of records
     * @return Number of records inserted or replaced
     */
    size_t load_records(const std::string& json) {
        size_t skipped = 0;
        auto records = Record::list_from_json(json, &skipped);
        size_t loaded = records.size();
        for (auto& record : records) {
            insert(std::move(record));
        }

        utilities::log_info("ContentStore: Loaded " + std::to_string(loaded) + " record(s)" +
                            (skipped > 0 ? ", skipped " + std::to_string(skipped) : std::string()));
        return loaded;
    }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    void clear() { records_.clear(); }

private:
    std::unordered_map<Uuid, Record> records_;
};

} // namespace meshdir
