#pragma once

/**
 * @file sorted_store.h
 * @brief Read-only view of a key-value store sorted by integer timestamp.
 *
 * Keys are non-negative integers stored as 8-byte big-endian strings so that byte order is timestamp order.
 * Values are the raw (JSON) bytes of the record. Nothing in this interface writes to the store.
 */

#include <valinfo/valinfo_base.h>

#include <memory>
#include <string>
#include <string_view>

namespace valinfo::storage {

    inline constexpr size_t KEY_SIZE = sizeof(store_key_t);

    [[nodiscard]] std::string encode_key(store_key_t key);

    // Throws DecodeError when bytes is not exactly KEY_SIZE long
    [[nodiscard]] store_key_t decode_key(std::string_view bytes);

    /**
     * A position in the store. After any seek or step the cursor is either valid (positioned on a record) or has
     * run off one end of the store.
     */
    class StoreCursor {
    public:
        virtual ~StoreCursor() = default;

        virtual void seek_to_first() = 0;
        virtual void seek_to_last() = 0;

        // Position on the greatest key <= target, invalid when every key is greater
        virtual void seek_for_prev(store_key_t target) = 0;

        virtual void next() = 0;
        virtual void prev() = 0;

        [[nodiscard]] virtual bool valid() const = 0;

        // Only meaningful while valid()
        [[nodiscard]] virtual store_key_t key() const = 0;
        [[nodiscard]] virtual std::string_view value() const = 0;
    };

    class SortedStore {
    public:
        virtual ~SortedStore() = default;

        [[nodiscard]] virtual std::string_view name() const = 0;

        [[nodiscard]] virtual std::unique_ptr<StoreCursor> cursor() const = 0;
    };

} // namespace valinfo::storage
