#pragma once

/**
 * @file range_query.h
 * @brief Resolves a history request into an ordered, bounded sequence of decoded records.
 *
 * Selection modes, in order of precedence:
 * - bounded window: from_ts and/or to_ts set, every record with from_ts <= key <= to_ts in ascending order
 * - from start: every record in ascending order, count is not applied
 * - tail (default): the count most recent records (all when count is empty), presented oldest first
 */

#include <valinfo/storage/sorted_store.h>

#include <optional>
#include <string_view>
#include <vector>

namespace valinfo {

    struct HistoryQuery {
        std::optional<size_t> count{1};         // empty means unlimited
        bool from_start{false};
        std::optional<store_key_t> from_ts;
        std::optional<store_key_t> to_ts;

        [[nodiscard]] bool bounded() const { return from_ts.has_value() || to_ts.has_value(); }

        // Throws InvalidRange when both bounds are set and from_ts > to_ts
        void validate() const;
    };

    struct Record {
        store_key_t timestamp;
        json data;
    };

    /// Field injected into every decoded record with the human readable form of its key
    inline constexpr std::string_view UPDATE_TIME_FIELD = "Update_time";

    class RangeQueryEngine {
    public:
        /**
         * Run the query against one store. Any record that does not decode to a JSON object aborts the whole query
         * with a DecodeError, no partial result is returned.
         */
        [[nodiscard]] std::vector<Record> query(const storage::SortedStore& store, const HistoryQuery& request) const;

        // Decode one stored value and inject the update time
        [[nodiscard]] static Record decode(store_key_t key, std::string_view bytes);

    private:
        static void scan_window(storage::StoreCursor& cursor, const HistoryQuery& request, std::vector<Record>& out);
        static void scan_forward(storage::StoreCursor& cursor, std::vector<Record>& out);
        static void scan_tail(storage::StoreCursor& cursor, std::optional<size_t> count, std::vector<Record>& out);
    };

} // namespace valinfo
