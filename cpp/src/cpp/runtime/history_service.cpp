#include <valinfo/enrichment/enrichment.h>
#include <valinfo/runtime/history_service.h>
#include <valinfo/types/value/path.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/logging.h>

namespace valinfo {

    std::vector<StoreReport> HistoryService::run(const storage::StoreCatalog& catalog, const HistoryRequest& request) {
        request.query.validate();
        for (const auto& path : request.field_paths) { static_cast<void>(value::parse_path(path)); }

        std::vector<StoreReport> reports;
        for (const auto& location : catalog.select(request.node)) {
            std::unique_ptr<storage::SortedStore> store;
            try {
                store = catalog.open(location);
            } catch (const StoreError& e) {
                log::logger()->error("{}", e.what());
                reports.push_back({location.name, {}, std::string{e.what()}, {}});
                continue;
            }
            reports.push_back(run_store(*store, request));
        }
        return reports;
    }

    StoreReport HistoryService::run_store(const storage::SortedStore& store, const HistoryRequest& request) {
        StoreReport report{std::string{store.name()}, {}, std::nullopt, {}};

        std::vector<Record> records;
        try {
            records = _engine.query(store, request.query);
        } catch (const DecodeError& e) {
            report.error = e.what();
            return report;
        } catch (const StoreError& e) {
            log::logger()->error("Store '{}': {}", store.name(), e.what());
            report.error = e.what();
            return report;
        }

        report.blocks.reserve(records.size());
        for (const auto& record : records) { report.blocks.push_back(render_record(record, request, report)); }
        return report;
    }

    schema::SchemaValue HistoryService::build_record(const Record& record, bool verbose) {
        auto tree = schema::SchemaValue::build(record.data, _schema.root(), verbose);
        enrichment::EnrichmentContext context{_probes};
        tree.enrich(context);
        return tree;
    }

    std::string HistoryService::render_record(const Record& record, const HistoryRequest& request,
                                              StoreReport& report) {
        auto tree = build_record(record, request.verbose);
        if (request.field_paths.empty()) { return render::render(tree, request.mode); }

        auto canonical = tree.to_json();
        std::vector<std::string> parts;
        for (const auto& path : request.field_paths) {
            if (_failed_paths.contains(path)) continue;
            try {
                parts.push_back(render::render_field(canonical, path));
            } catch (const MissingPath& e) {
                log::logger()->debug("Record {}: {}", record.timestamp, e.what());
                report.missing_paths.emplace_back(e.what());
                _failed_paths.insert(path);
            }
        }
        return fmt::format("{}", fmt::join(parts, "\n"));
    }

} // namespace valinfo
