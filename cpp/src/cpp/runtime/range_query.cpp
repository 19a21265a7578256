#include <valinfo/runtime/range_query.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/logging.h>

#include <algorithm>

namespace valinfo {

    void HistoryQuery::validate() const {
        if (from_ts && to_ts && *from_ts > *to_ts) {
            throw_error<InvalidRange>("Invalid range: from ({}) is after to ({})", *from_ts, *to_ts);
        }
    }

    Record RangeQueryEngine::decode(store_key_t key, std::string_view bytes) {
        auto data = json::parse(bytes, nullptr, false);
        if (data.is_discarded()) {
            throw DecodeError(fmt::format("Record {} is not valid JSON", key), key);
        }
        if (!data.is_object()) {
            throw DecodeError(fmt::format("Record {} is a JSON {}, expected an object", key, data.type_name()), key);
        }
        data[std::string{UPDATE_TIME_FIELD}] = human_timestamp(key);
        return {key, std::move(data)};
    }

    std::vector<Record> RangeQueryEngine::query(const storage::SortedStore& store, const HistoryQuery& request) const {
        request.validate();

        auto cursor = store.cursor();
        std::vector<Record> records;
        try {
            if (request.bounded()) {
                scan_window(*cursor, request, records);
            } else if (request.from_start) {
                scan_forward(*cursor, records);
            } else {
                scan_tail(*cursor, request.count, records);
            }
        } catch (const DecodeError &e) {
            log::logger()->error("Store '{}': {}", store.name(), e.what());
            throw;
        }

        log::logger()->debug("Store '{}': {} record(s) selected", store.name(), records.size());
        return records;
    }

    void RangeQueryEngine::scan_window(storage::StoreCursor& cursor, const HistoryQuery& request,
                                       std::vector<Record>& out) {
        if (request.from_ts) {
            cursor.seek_for_prev(*request.from_ts);
            // Nothing at or before the lower bound, the window starts at the first record
            if (!cursor.valid()) { cursor.seek_to_first(); }
        } else {
            cursor.seek_to_first();
        }

        for (; cursor.valid(); cursor.next()) {
            auto key = cursor.key();
            if (request.from_ts && key < *request.from_ts) { continue; }
            if (request.to_ts && key > *request.to_ts) { break; }
            out.push_back(decode(key, cursor.value()));
        }
    }

    void RangeQueryEngine::scan_forward(storage::StoreCursor& cursor, std::vector<Record>& out) {
        for (cursor.seek_to_first(); cursor.valid(); cursor.next()) {
            out.push_back(decode(cursor.key(), cursor.value()));
        }
    }

    void RangeQueryEngine::scan_tail(storage::StoreCursor& cursor, std::optional<size_t> count,
                                     std::vector<Record>& out) {
        if (count && *count == 0) { return; }
        for (cursor.seek_to_last(); cursor.valid(); cursor.prev()) {
            out.push_back(decode(cursor.key(), cursor.value()));
            if (count && out.size() >= *count) { break; }
        }
        std::ranges::reverse(out);
    }

} // namespace valinfo
