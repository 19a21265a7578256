#include <valinfo/enrichment/enrichment.h>
#include <valinfo/types/value/binding.h>
#include <valinfo/util/logging.h>

namespace valinfo::enrichment {

    std::string EnrichmentContext::network_notation(const std::string& ip) {
        if (ip == "*" || ip == "0.0.0.0") return "0.0.0.0/0";
        if (ip == "::") return "::/0";

        auto it = _prefix_cache.find(ip);
        if (it == _prefix_cache.end()) {
            it = _prefix_cache.emplace(ip, _probes.addresses.prefix_length(ip)).first;
        }
        return it->second ? fmt::format("{}/{}", ip, *it->second) : ip;
    }

    namespace {

        void assign_checked(const FieldEnricher& enricher, std::string_view field_name, value::ValueCell& cell,
                            const json& raw) {
            auto outcome = cell.assign(raw);
            if (!outcome.ok()) {
                log::logger()->warn("{} produced an unusable value for '{}': {}", enricher.name(), field_name,
                                    outcome.error);
            }
        }

        class BindingsEnricher final : public FieldEnricher {
        public:
            [[nodiscard]] std::string_view name() const override { return "BindingsEnricher"; }

            [[nodiscard]] bool wants(const value::ValueCell& cell) const override {
                if (!cell.is_unknown() || !cell.source().is_number_integer()) return false;
                auto port = cell.source().get<std::int64_t>();
                return port >= 0 && port <= 65535;
            }

            void enrich(std::string_view field_name, value::ValueCell& cell, EnrichmentContext& context) const override {
                auto port = static_cast<std::uint16_t>(cell.source().get<std::int64_t>());
                value::BindingList bindings;
                for (const auto& entry : context.probes().sockets.list_bindings(port)) {
                    value::add_unique(bindings, {port, entry.protocol, context.network_notation(entry.ip)});
                }
                if (bindings.empty()) {
                    log::logger()->debug("No listeners found for {} port {}", field_name, port);
                }
                // An empty list is a present value: the port was declared but nothing listens on it
                assign_checked(*this, field_name, cell, json(bindings));
            }
        };

        class RunStateEnricher final : public FieldEnricher {
        public:
            [[nodiscard]] std::string_view name() const override { return "RunStateEnricher"; }

            [[nodiscard]] bool wants(const value::ValueCell& cell) const override { return cell.is_unknown(); }

            void enrich(std::string_view field_name, value::ValueCell& cell, EnrichmentContext& context) const override {
                auto& control = context.probes().process;
                auto state = control.run_state();
                if (state == probes::RunState::Indeterminate) {
                    log::logger()->info("{} reported an unrecognised run state for '{}'", control.backend_name(),
                                        field_name);
                    return;
                }
                assign_checked(*this, field_name, cell, std::string{probes::to_string(state)});
            }
        };

        class EnabledStateEnricher final : public FieldEnricher {
        public:
            [[nodiscard]] std::string_view name() const override { return "EnabledStateEnricher"; }

            [[nodiscard]] bool wants(const value::ValueCell& cell) const override { return cell.is_unknown(); }

            void enrich(std::string_view field_name, value::ValueCell& cell, EnrichmentContext& context) const override {
                auto& control = context.probes().process;
                auto state = control.enabled_state();
                if (state == probes::EnabledState::Indeterminate) {
                    log::logger()->info("{} reported an unrecognised enabled state for '{}'",
                                        control.backend_name(), field_name);
                    return;
                }
                assign_checked(*this, field_name, cell, std::string{probes::to_string(state)});
            }
        };

        class PackageVersionEnricher final : public FieldEnricher {
        public:
            [[nodiscard]] std::string_view name() const override { return "PackageVersionEnricher"; }

            [[nodiscard]] bool wants(const value::ValueCell& cell) const override { return cell.is_unknown(); }

            void enrich(std::string_view field_name, value::ValueCell& cell, EnrichmentContext& context) const override {
                auto version = context.probes().packages.installed_version(std::string{field_name});
                if (!version) {
                    log::logger()->warn("Could not determine the installed version of package '{}'", field_name);
                    return;
                }
                assign_checked(*this, field_name, cell, *version);
            }
        };

    } // namespace

    const FieldEnricher* bindings_enricher() {
        static const BindingsEnricher enricher;
        return &enricher;
    }

    const FieldEnricher* run_state_enricher() {
        static const RunStateEnricher enricher;
        return &enricher;
    }

    const FieldEnricher* enabled_state_enricher() {
        static const EnabledStateEnricher enricher;
        return &enricher;
    }

    const FieldEnricher* package_version_enricher() {
        static const PackageVersionEnricher enricher;
        return &enricher;
    }

} // namespace valinfo::enrichment
