#pragma once

/**
 * @file history_service.h
 * @brief Runs one history request over the selected stores, one store at a time.
 *
 * Per store: open, query, then for every record build the typed tree, run a fresh enrichment pass and render it.
 * A store that cannot be opened or holds a corrupted record reports its error and yields no blocks, the other
 * stores are unaffected.
 */

#include <valinfo/probes/probes.h>
#include <valinfo/render/report_renderer.h>
#include <valinfo/runtime/range_query.h>
#include <valinfo/storage/store_catalog.h>
#include <valinfo/types/schema/validator_schema.h>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace valinfo {

    struct HistoryRequest {
        HistoryQuery query;
        std::optional<std::string> node;            // all stores when empty
        render::OutputMode mode{render::OutputMode::Narrative};
        bool verbose{false};
        std::vector<std::string> field_paths;       // selective rendering, overrides mode when non-empty
    };

    struct StoreReport {
        std::string name;
        std::vector<std::string> blocks;            // one rendered block per record, oldest first
        std::optional<std::string> error;
        std::vector<std::string> missing_paths;     // MissingPath messages raised while rendering this store

        [[nodiscard]] bool ok() const { return !error && missing_paths.empty(); }
    };

    class HistoryService {
    public:
        HistoryService(const schema::ValidatorInfoSchema& schema, probes::ProbeSet probes)
            : _schema{schema}, _probes{probes} {}

        /**
         * Run request over the stores of catalog.
         * @throws InvalidRange before any store is opened
         * @throws InvalidPath before any store is opened, for a malformed field path
         * @throws StoreError when the catalog cannot be listed or the selected node has no store
         */
        [[nodiscard]] std::vector<StoreReport> run(const storage::StoreCatalog& catalog, const HistoryRequest& request);

        // Query and render a single open store
        [[nodiscard]] StoreReport run_store(const storage::SortedStore& store, const HistoryRequest& request);

        // Typed tree of one decoded record, enriched
        [[nodiscard]] schema::SchemaValue build_record(const Record& record, bool verbose);

    private:
        std::string render_record(const Record& record, const HistoryRequest& request, StoreReport& report);

        const schema::ValidatorInfoSchema& _schema;
        probes::ProbeSet _probes;
        RangeQueryEngine _engine;
        std::set<std::string> _failed_paths;        // paths already reported missing, skipped from then on
    };

} // namespace valinfo
