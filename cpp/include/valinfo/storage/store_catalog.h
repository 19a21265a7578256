#pragma once

#include <valinfo/storage/sorted_store.h>

#include <optional>
#include <string>
#include <vector>

namespace valinfo::storage {

    struct StoreLocation {
        std::string name;
        std::string path;
    };

    /**
     * The history stores found in one directory. Every file named <node><suffix> is the store for <node>.
     */
    class StoreCatalog {
    public:
        StoreCatalog(std::string directory, std::string suffix);

        // Sorted by node name. Throws StoreError when the directory cannot be listed.
        [[nodiscard]] std::vector<StoreLocation> list() const;

        // All stores when selector is empty, otherwise just the named one (StoreError when it does not exist)
        [[nodiscard]] std::vector<StoreLocation> select(const std::optional<std::string>& selector) const;

        [[nodiscard]] std::unique_ptr<SortedStore> open(const StoreLocation& location) const;

        [[nodiscard]] const std::string& directory() const { return _directory; }
        [[nodiscard]] const std::string& suffix() const { return _suffix; }

    private:
        std::string _directory;
        std::string _suffix;
    };

} // namespace valinfo::storage
