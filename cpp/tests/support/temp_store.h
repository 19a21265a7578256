#pragma once

/**
 * Writes history stores in the on-disk layout read by SqliteStore, inside a per-test temporary directory that is
 * removed again on destruction.
 */

#include <valinfo/storage/sorted_store.h>

#include <sqlite3.h>

#include <filesystem>
#include <map>
#include <random>
#include <stdexcept>
#include <string>

namespace valinfo::testing {

    class TempHistoryDir {
    public:
        TempHistoryDir() {
            std::random_device rd;
            _path = std::filesystem::temp_directory_path() / fmt::format("valinfo-test-{:x}", rd());
            std::filesystem::create_directories(_path);
        }

        ~TempHistoryDir() {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }

        TempHistoryDir(const TempHistoryDir&) = delete;
        TempHistoryDir& operator=(const TempHistoryDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const { return _path; }

        std::string write_store(const std::string& file_name, const std::map<store_key_t, std::string>& records) const {
            auto file = (_path / file_name).string();
            sqlite3* db = nullptr;
            if (sqlite3_open(file.c_str(), &db) != SQLITE_OK) {
                sqlite3_close(db);
                throw std::runtime_error("cannot create " + file);
            }
            exec(db, "CREATE TABLE IF NOT EXISTS kv (key BLOB PRIMARY KEY, value BLOB) WITHOUT ROWID");

            sqlite3_stmt* stmt = nullptr;
            sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2)", -1, &stmt, nullptr);
            for (const auto& [key, value] : records) {
                auto encoded = storage::encode_key(key);
                sqlite3_bind_blob(stmt, 1, encoded.data(), static_cast<int>(encoded.size()), SQLITE_TRANSIENT);
                sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
                sqlite3_step(stmt);
                sqlite3_reset(stmt);
            }
            sqlite3_finalize(stmt);
            sqlite3_close(db);
            return file;
        }

    private:
        static void exec(sqlite3* db, const char* sql) {
            char* error = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
                std::string message = error ? error : "unknown error";
                sqlite3_free(error);
                sqlite3_close(db);
                throw std::runtime_error(message);
            }
        }

        std::filesystem::path _path;
    };

} // namespace valinfo::testing
