#pragma once

#include <valinfo/storage/sorted_store.h>

#include <map>

namespace valinfo::storage {

    /**
     * An ordered in-memory store. put() exists to populate it, the query path only reads through cursors.
     */
    class MemoryStore : public SortedStore {
    public:
        explicit MemoryStore(std::string name) : _name{std::move(name)} {}

        void put(store_key_t key, std::string value) { _records[key] = std::move(value); }

        [[nodiscard]] size_t size() const { return _records.size(); }

        [[nodiscard]] std::string_view name() const override { return _name; }

        [[nodiscard]] std::unique_ptr<StoreCursor> cursor() const override;

    private:
        std::string _name;
        std::map<store_key_t, std::string> _records;
    };

} // namespace valinfo::storage
