#pragma once

#include <valinfo/storage/sorted_store.h>

struct sqlite3;

namespace valinfo::storage {

    /**
     * A history store kept in a SQLite database, opened read-only.
     *
     * Layout: kv(key BLOB PRIMARY KEY, value BLOB) WITHOUT ROWID, keys encoded with encode_key(). SQLite compares
     * BLOBs with memcmp, so key order in the table is timestamp order.
     */
    class SqliteStore : public SortedStore {
    public:
        static constexpr std::string_view TABLE_NAME = "kv";

        // Throws StoreError when the file cannot be opened or has no kv table
        SqliteStore(std::string name, const std::string& path);
        ~SqliteStore() override;

        SqliteStore(const SqliteStore&) = delete;
        SqliteStore& operator=(const SqliteStore&) = delete;

        [[nodiscard]] std::string_view name() const override { return _name; }

        [[nodiscard]] std::unique_ptr<StoreCursor> cursor() const override;

    private:
        std::string _name;
        sqlite3* _db{nullptr};
    };

} // namespace valinfo::storage
