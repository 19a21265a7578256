#include <valinfo/storage/sqlite_store.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/logging.h>
#include <valinfo/util/scope.h>

#include <sqlite3.h>

#include <optional>

namespace valinfo::storage {

    namespace {

        class Statement {
        public:
            Statement(sqlite3* db, const char* sql) {
                if (sqlite3_prepare_v2(db, sql, -1, &_stmt, nullptr) != SQLITE_OK) {
                    throw_error<StoreError>("Failed to prepare '{}': {}", sql, sqlite3_errmsg(db));
                }
            }

            ~Statement() { sqlite3_finalize(_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            [[nodiscard]] sqlite3_stmt* get() const { return _stmt; }

        private:
            sqlite3_stmt* _stmt{nullptr};
        };

        /**
         * Each step is a single-row query relative to the current key, so the cursor can move in either direction
         * without holding a statement open across moves.
         */
        class SqliteCursor final : public StoreCursor {
        public:
            explicit SqliteCursor(sqlite3* db)
                : _db{db},
                  _first{db, "SELECT key, value FROM kv ORDER BY key ASC LIMIT 1"},
                  _last{db, "SELECT key, value FROM kv ORDER BY key DESC LIMIT 1"},
                  _at_or_before{db, "SELECT key, value FROM kv WHERE key <= ?1 ORDER BY key DESC LIMIT 1"},
                  _after{db, "SELECT key, value FROM kv WHERE key > ?1 ORDER BY key ASC LIMIT 1"},
                  _before{db, "SELECT key, value FROM kv WHERE key < ?1 ORDER BY key DESC LIMIT 1"} {
            }

            void seek_to_first() override { load(_first, std::nullopt); }
            void seek_to_last() override { load(_last, std::nullopt); }
            void seek_for_prev(store_key_t target) override { load(_at_or_before, target); }

            void next() override {
                if (_current) load(_after, _current->first);
            }

            void prev() override {
                if (_current) load(_before, _current->first);
            }

            [[nodiscard]] bool valid() const override { return _current.has_value(); }
            [[nodiscard]] store_key_t key() const override { return _current->first; }
            [[nodiscard]] std::string_view value() const override { return _current->second; }

        private:
            void load(const Statement& statement, std::optional<store_key_t> bound) {
                auto* stmt = statement.get();
                auto reset = make_scope_exit([stmt] {
                    sqlite3_reset(stmt);
                    sqlite3_clear_bindings(stmt);
                });

                if (bound) {
                    auto encoded = encode_key(*bound);
                    sqlite3_bind_blob(stmt, 1, encoded.data(), static_cast<int>(encoded.size()), SQLITE_TRANSIENT);
                }

                int rc = sqlite3_step(stmt);
                if (rc == SQLITE_DONE) {
                    _current.reset();
                    return;
                }
                if (rc != SQLITE_ROW) {
                    _current.reset();
                    throw_error<StoreError>("Failed to read store: {}", sqlite3_errmsg(_db));
                }

                auto key_bytes = static_cast<const char*>(sqlite3_column_blob(stmt, 0));
                auto key_size = static_cast<size_t>(sqlite3_column_bytes(stmt, 0));
                auto value_bytes = static_cast<const char*>(sqlite3_column_blob(stmt, 1));
                auto value_size = static_cast<size_t>(sqlite3_column_bytes(stmt, 1));

                auto key = decode_key(std::string_view{key_bytes == nullptr ? "" : key_bytes, key_size});
                _current.emplace(key, std::string{value_bytes == nullptr ? "" : value_bytes, value_size});
            }

            sqlite3* _db;
            Statement _first;
            Statement _last;
            Statement _at_or_before;
            Statement _after;
            Statement _before;
            std::optional<std::pair<store_key_t, std::string>> _current;
        };

    } // namespace

    SqliteStore::SqliteStore(std::string name, const std::string& path) : _name{std::move(name)} {
        int rc = sqlite3_open_v2(path.c_str(), &_db, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = _db != nullptr ? sqlite3_errmsg(_db) : sqlite3_errstr(rc);
            sqlite3_close(_db);
            _db = nullptr;
            throw_error<StoreError>("Failed to open store '{}' at {}: {}", _name, path, message);
        }

        sqlite3_stmt* probe = nullptr;
        rc = sqlite3_prepare_v2(_db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'kv'", -1, &probe,
                                nullptr);
        bool has_table = rc == SQLITE_OK && sqlite3_step(probe) == SQLITE_ROW;
        sqlite3_finalize(probe);
        if (!has_table) {
            sqlite3_close(_db);
            _db = nullptr;
            throw_error<StoreError>("Store '{}' at {} has no {} table", _name, path, TABLE_NAME);
        }
        log::logger()->debug("Opened store '{}' ({})", _name, path);
    }

    SqliteStore::~SqliteStore() {
        if (_db) {
            sqlite3_close(_db);
            _db = nullptr;
        }
    }

    std::unique_ptr<StoreCursor> SqliteStore::cursor() const { return std::make_unique<SqliteCursor>(_db); }

} // namespace valinfo::storage
