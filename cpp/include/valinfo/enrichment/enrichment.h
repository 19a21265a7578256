#pragma once

/**
 * @file enrichment.h
 * @brief Field enrichers that replace unknown record values with values computed from live system state.
 *
 * One EnrichmentContext is created per record (one enrichment pass). Address prefix lookups are cached in the
 * context, so an address shared by several bindings of the record is resolved once.
 */

#include <valinfo/enrichment/field_enricher.h>
#include <valinfo/probes/probes.h>

#include <optional>
#include <string>
#include <unordered_map>

namespace valinfo::enrichment {

    class EnrichmentContext {
    public:
        explicit EnrichmentContext(probes::ProbeSet probes) : _probes{probes} {}

        [[nodiscard]] probes::ProbeSet& probes() { return _probes; }

        /**
         * The address as written in a binding: wildcards become 0.0.0.0/0 or ::/0, any other address gets its
         * network prefix appended when one can be found.
         */
        std::string network_notation(const std::string& ip);

        // Number of distinct addresses resolved through the address probe in this pass
        [[nodiscard]] size_t address_lookups() const { return _prefix_cache.size(); }

    private:
        probes::ProbeSet _probes;
        std::unordered_map<std::string, std::optional<int>> _prefix_cache;
    };

    /// Declared port -> listener bindings found in the socket table
    const FieldEnricher* bindings_enricher();

    /// Unknown run state -> state reported by the process control plane
    const FieldEnricher* run_state_enricher();

    /// Unknown enabled state -> state reported by the process control plane
    const FieldEnricher* enabled_state_enricher();

    /// Unknown package version -> version of the locally installed package named by the field
    const FieldEnricher* package_version_enricher();

} // namespace valinfo::enrichment
