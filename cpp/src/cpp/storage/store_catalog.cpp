#include <valinfo/storage/sqlite_store.h>
#include <valinfo/storage/store_catalog.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/logging.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace valinfo::storage {

    StoreCatalog::StoreCatalog(std::string directory, std::string suffix)
        : _directory{std::move(directory)}, _suffix{std::move(suffix)} {
        if (_suffix.empty()) { throw_error<std::invalid_argument>("Store suffix must not be empty"); }
    }

    std::vector<StoreLocation> StoreCatalog::list() const {
        std::error_code ec;
        fs::directory_iterator it{_directory, ec};
        if (ec) { throw_error<StoreError>("Cannot list history directory {}: {}", _directory, ec.message()); }

        std::vector<StoreLocation> stores;
        for (const auto& entry : it) {
            if (!entry.is_regular_file(ec) || ec) { continue; }
            auto file_name = entry.path().filename().string();
            if (file_name.size() <= _suffix.size() || !file_name.ends_with(_suffix)) { continue; }
            stores.push_back({file_name.substr(0, file_name.size() - _suffix.size()), entry.path().string()});
        }
        std::ranges::sort(stores, {}, &StoreLocation::name);
        log::logger()->debug("Found {} store(s) in {}", stores.size(), _directory);
        return stores;
    }

    std::vector<StoreLocation> StoreCatalog::select(const std::optional<std::string>& selector) const {
        auto stores = list();
        if (!selector) { return stores; }

        auto it = std::ranges::find(stores, *selector, &StoreLocation::name);
        if (it == stores.end()) {
            throw_error<StoreError>("No history store for node '{}' in {}", *selector, _directory);
        }
        return {*it};
    }

    std::unique_ptr<SortedStore> StoreCatalog::open(const StoreLocation& location) const {
        return std::make_unique<SqliteStore>(location.name, location.path);
    }

} // namespace valinfo::storage
