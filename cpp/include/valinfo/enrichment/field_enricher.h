#pragma once

#include <valinfo/types/value/value_cell.h>

#include <string_view>

namespace valinfo::enrichment {

    class EnrichmentContext;

    /**
     * @brief Post-processing hook attached to a schema field.
     *
     * After a record's tree has been constructed, every field carrying an enricher is offered to it. The enricher
     * decides from the cell (normally: only when it is unknown) whether to derive a value from live system state.
     * Probe failures may propagate as ProbeFailure, the tree walk contains them to the one field.
     */
    class FieldEnricher {
    public:
        virtual ~FieldEnricher() = default;

        [[nodiscard]] virtual std::string_view name() const = 0;

        [[nodiscard]] virtual bool wants(const value::ValueCell& cell) const = 0;

        virtual void enrich(std::string_view field_name, value::ValueCell& cell, EnrichmentContext& context) const = 0;
    };

} // namespace valinfo::enrichment
