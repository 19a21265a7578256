/**
 * @file test_range_query.cpp
 * @brief Selection modes of RangeQueryEngine over an in-memory store.
 */

#include <catch2/catch_test_macros.hpp>
#include <valinfo/runtime/range_query.h>
#include <valinfo/storage/memory_store.h>
#include <valinfo/util/errors.h>

using namespace valinfo;
using namespace valinfo::storage;

namespace {

    // Records at 100, 110, ..., 190
    MemoryStore ten_records() {
        MemoryStore store{"Node1"};
        for (store_key_t key = 100; key < 200; key += 10) {
            store.put(key, json{{"timestamp", key}}.dump());
        }
        return store;
    }

    std::vector<store_key_t> keys(const std::vector<Record>& records) {
        std::vector<store_key_t> out;
        for (const auto& record : records) out.push_back(record.timestamp);
        return out;
    }

    HistoryQuery window(std::optional<store_key_t> from, std::optional<store_key_t> to) {
        HistoryQuery query;
        query.from_ts = from;
        query.to_ts = to;
        return query;
    }

}  // namespace

// ============================================================================
// Bounded window
// ============================================================================

TEST_CASE("RangeQuery - window is inclusive and ascending", "[runtime][range][window]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    CHECK(keys(engine.query(store, window(120, 150))) == std::vector<store_key_t>{120, 130, 140, 150});
    CHECK(keys(engine.query(store, window(125, 151))) == std::vector<store_key_t>{130, 140, 150});
    CHECK(keys(engine.query(store, window(130, 130))) == std::vector<store_key_t>{130});
    CHECK(engine.query(store, window(131, 139)).empty());
}

TEST_CASE("RangeQuery - lower bound before the first key keeps the first record", "[runtime][range][window]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    auto records = engine.query(store, window(0, 115));
    CHECK(keys(records) == std::vector<store_key_t>{100, 110});
}

TEST_CASE("RangeQuery - open ended windows", "[runtime][range][window]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    CHECK(keys(engine.query(store, window(175, std::nullopt))) == std::vector<store_key_t>{180, 190});
    CHECK(keys(engine.query(store, window(std::nullopt, 115))) == std::vector<store_key_t>{100, 110});
    CHECK(engine.query(store, window(500, std::nullopt)).empty());
}

TEST_CASE("RangeQuery - window ignores count and from_start", "[runtime][range][window]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    auto query = window(100, 130);
    query.count = 1;
    query.from_start = true;
    CHECK(keys(engine.query(store, query)) == std::vector<store_key_t>{100, 110, 120, 130});
}

TEST_CASE("RangeQuery - every in-window key exactly once", "[runtime][range][window]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    for (store_key_t from = 90; from <= 200; from += 7) {
        for (store_key_t to = from; to <= 210; to += 11) {
            std::vector<store_key_t> expected;
            for (store_key_t key = 100; key < 200; key += 10) {
                if (key >= from && key <= to) expected.push_back(key);
            }
            INFO("from " << from << " to " << to);
            CHECK(keys(engine.query(store, window(from, to))) == expected);
        }
    }
}

TEST_CASE("RangeQuery - inverted window is rejected", "[runtime][range][window]") {
    auto store = ten_records();
    RangeQueryEngine engine;
    CHECK_THROWS_AS(engine.query(store, window(150, 120)), InvalidRange);
    CHECK_THROWS_AS(window(2, 1).validate(), InvalidRange);
    CHECK_NOTHROW(window(1, 1).validate());
}

// ============================================================================
// From start and tail
// ============================================================================

TEST_CASE("RangeQuery - from start returns everything regardless of count", "[runtime][range][start]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    HistoryQuery query;
    query.from_start = true;
    query.count = 2;
    auto records = engine.query(store, query);
    REQUIRE(records.size() == 10);
    CHECK(records.front().timestamp == 100u);
    CHECK(records.back().timestamp == 190u);
}

TEST_CASE("RangeQuery - tail returns the most recent records oldest first", "[runtime][range][tail]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    HistoryQuery query;
    query.count = 3;
    CHECK(keys(engine.query(store, query)) == std::vector<store_key_t>{170, 180, 190});

    query.count = 1;
    CHECK(keys(engine.query(store, query)) == std::vector<store_key_t>{190});

    query.count = 50;
    CHECK(engine.query(store, query).size() == 10);

    query.count = std::nullopt;
    CHECK(engine.query(store, query).size() == 10);
    CHECK(engine.query(store, query).front().timestamp == 100u);
}

TEST_CASE("RangeQuery - empty store yields nothing in every mode", "[runtime][range]") {
    MemoryStore store{"empty"};
    RangeQueryEngine engine;

    CHECK(engine.query(store, HistoryQuery{}).empty());
    HistoryQuery from_start;
    from_start.from_start = true;
    CHECK(engine.query(store, from_start).empty());
    CHECK(engine.query(store, window(1, 10)).empty());
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE("RangeQuery - update time is injected", "[runtime][range][decode]") {
    auto store = ten_records();
    RangeQueryEngine engine;

    auto records = engine.query(store, HistoryQuery{});
    REQUIRE(records.size() == 1);
    const auto& data = records[0].data;
    CHECK(data["timestamp"] == 190);
    REQUIRE(data.contains("Update_time"));
    CHECK(data["Update_time"] == human_timestamp(190));
    CHECK(data["Update_time"].get<std::string>().ends_with(" (190)"));
}

TEST_CASE("RangeQuery - corrupted record aborts the query", "[runtime][range][decode]") {
    auto store = ten_records();
    store.put(150, "{not json");
    RangeQueryEngine engine;

    try {
        static_cast<void>(engine.query(store, window(100, 200)));
        FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
        REQUIRE(e.key().has_value());
        CHECK(*e.key() == 150u);
    }

    // Records outside the corrupted key still decode
    CHECK(engine.query(store, window(100, 140)).size() == 5);
}

TEST_CASE("RangeQuery - non object JSON is a decode error", "[runtime][range][decode]") {
    CHECK_THROWS_AS(RangeQueryEngine::decode(1, "[1, 2]"), DecodeError);
    CHECK_THROWS_AS(RangeQueryEngine::decode(1, "42"), DecodeError);
    CHECK_THROWS_AS(RangeQueryEngine::decode(1, ""), DecodeError);
    CHECK(RangeQueryEngine::decode(1, "{}").data.size() == 1);
}

TEST_CASE("RangeQuery - sibling store unaffected by a corrupted one", "[runtime][range][decode]") {
    auto good = ten_records();
    MemoryStore bad{"Node2"};
    bad.put(100, "\xff\xfe");
    RangeQueryEngine engine;

    HistoryQuery query;
    query.from_start = true;
    CHECK_THROWS_AS(engine.query(bad, query), DecodeError);
    CHECK(engine.query(good, query).size() == 10);
}
