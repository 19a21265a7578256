/**
 * @file cell_types.cpp
 * @brief Operations for the built-in cell kinds.
 *
 * Each kind provides a CellOpsFor<K> specialisation with static normalize/render functions, make_ops() gathers
 * them with the kind's JSON writer into the CellOps table referenced by the kind's CellTypeMeta.
 */

#include <valinfo/types/value/binding.h>
#include <valinfo/types/value/cell_type.h>
#include <valinfo/util/string_utils.h>

#include <charconv>
#include <cstdint>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace valinfo::value {

    namespace {

        // The value as it was stored
        json stored_to_json(const json&, const json& source, const CellTypeMeta*) { return source; }

        json normalised_to_json(const json& value, const json&, const CellTypeMeta*) { return value; }

        // Numbers may arrive as JSON numbers or as numeric strings written by older collectors
        std::optional<double> as_number(const json& raw) {
            if (raw.is_number()) return raw.get<double>();
            if (raw.is_string()) {
                const auto& text = raw.get_ref<const std::string&>();
                auto trimmed = trim(text);
                double value = 0.0;
                auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
                if (ec == std::errc() && ptr == trimmed.data() + trimmed.size() && !trimmed.empty()) return value;
            }
            return std::nullopt;
        }

        constexpr double MAX_SECONDS = 9223372036854775808.0;

        template<CellKind K>
        struct CellOpsFor;

        // ========== Plain ==========

        template<>
        struct CellOpsFor<CellKind::Plain> {
            static FieldOutcome normalize(const json& raw, const CellTypeMeta*) {
                if (raw.is_null()) return FieldOutcome::unknown();
                return FieldOutcome::present(raw);
            }

            static std::string render(const json& value, const CellTypeMeta*) {
                if (value.is_string()) return value.get<std::string>();
                return value.dump();
            }

            static constexpr CellOps make_ops() { return CellOps{&normalize, &render, &stored_to_json}; }
        };

        // ========== Float ==========

        template<>
        struct CellOpsFor<CellKind::Float> {
            static FieldOutcome normalize(const json& raw, const CellTypeMeta* meta) {
                if (raw.is_null()) return FieldOutcome::unknown();
                auto number = as_number(raw);
                if (!number || !std::isfinite(*number)) {
                    return FieldOutcome::malformed(fmt::format("{} expects a number, got {}", meta->name, raw.dump()));
                }
                return FieldOutcome::present(*number);
            }

            static std::string render(const json& value, const CellTypeMeta*) {
                return fmt::format("{:.2f}", value.get<double>());
            }

            static constexpr CellOps make_ops() { return CellOps{&normalize, &render, &stored_to_json}; }
        };

        // ========== Duration ==========

        template<>
        struct CellOpsFor<CellKind::Duration> {
            static FieldOutcome normalize(const json& raw, const CellTypeMeta* meta) {
                if (raw.is_null()) return FieldOutcome::unknown();
                auto number = as_number(raw);
                if (!number || !std::isfinite(*number) || *number < 0) {
                    return FieldOutcome::malformed(
                        fmt::format("{} expects a non-negative number of seconds, got {}", meta->name, raw.dump()));
                }
                // 2^63 is exact as a double, anything at or above it does not fit the seconds counter
                if (*number >= MAX_SECONDS) {
                    return FieldOutcome::malformed(fmt::format("{} is out of range: {}", meta->name, raw.dump()));
                }
                return FieldOutcome::present(static_cast<std::int64_t>(std::floor(*number)));
            }

            static std::string render(const json& value, const CellTypeMeta*) {
                return format_duration(value.get<std::int64_t>());
            }

            static constexpr CellOps make_ops() { return CellOps{&normalize, &render, &stored_to_json}; }
        };

        // ========== ProcessState ==========

        template<>
        struct CellOpsFor<CellKind::ProcessState> {
            static FieldOutcome normalize(const json& raw, const CellTypeMeta* meta) {
                if (raw.is_null()) return FieldOutcome::unknown();
                if (raw.is_string()) return FieldOutcome::present(raw);
                // The collector writes the enabled flag as a boolean
                if (raw.is_boolean() && meta == enabled_state_type()) {
                    return FieldOutcome::present(raw.get<bool>() ? "enabled" : "disabled");
                }
                return FieldOutcome::malformed(fmt::format("{} expects a state label, got {}", meta->name, raw.dump()));
            }

            static std::string render(const json& value, const CellTypeMeta*) { return value.get<std::string>(); }

            static constexpr CellOps make_ops() { return CellOps{&normalize, &render, &stored_to_json}; }
        };

        // ========== AliasList ==========

        template<>
        struct CellOpsFor<CellKind::AliasList> {
            // Accepts ["Node1", "Node2"] or [["Node1", 0], ["Node2", null]], keeps the first occurrence of each alias
            static FieldOutcome normalize(const json& raw, const CellTypeMeta* meta) {
                if (raw.is_null()) return FieldOutcome::unknown();
                if (!raw.is_array()) {
                    return FieldOutcome::malformed(fmt::format("{} expects a list, got {}", meta->name, raw.dump()));
                }
                json aliases = json::array();
                std::unordered_set<std::string> seen;
                for (const auto& item : raw) {
                    const json* alias = &item;
                    if (item.is_array()) {
                        if (item.empty()) {
                            return FieldOutcome::malformed(fmt::format("{} has an empty alias entry", meta->name));
                        }
                        alias = &item.front();
                    }
                    if (!alias->is_string()) {
                        return FieldOutcome::malformed(
                            fmt::format("{} expects string aliases, got {}", meta->name, alias->dump()));
                    }
                    const auto& name = alias->get_ref<const std::string&>();
                    if (seen.insert(name).second) aliases.push_back(name);
                }
                return FieldOutcome::present(std::move(aliases));
            }

            static std::string render(const json& value, const CellTypeMeta*) {
                std::vector<std::string> lines;
                lines.reserve(value.size());
                for (const auto& alias : value) {
                    lines.push_back(fmt::format("{}    {}", VERBOSE_MARKER, alias.get<std::string>()));
                }
                return fmt::format("{}", fmt::join(lines, "\n"));
            }

            static constexpr CellOps make_ops() { return CellOps{&normalize, &render, &stored_to_json}; }
        };

        // ========== Bindings ==========

        template<>
        struct CellOpsFor<CellKind::Bindings> {
            // A list of {port, protocol, ip} objects is taken as already resolved. A bare port number stays unknown
            // (the cell keeps it as its source) until enrichment resolves the listeners for it.
            static FieldOutcome normalize(const json& raw, const CellTypeMeta* meta) {
                if (raw.is_null()) return FieldOutcome::unknown();
                if (raw.is_number_integer()) {
                    auto port = raw.get<std::int64_t>();
                    if (port < 0 || port > 65535) {
                        return FieldOutcome::malformed(fmt::format("{} port out of range: {}", meta->name, port));
                    }
                    return FieldOutcome::unknown();
                }
                if (!raw.is_array()) {
                    return FieldOutcome::malformed(
                        fmt::format("{} expects a port or a list of bindings, got {}", meta->name, raw.dump()));
                }
                BindingList bindings;
                for (const auto& item : raw) {
                    if (!item.is_object() || !item.contains("port") || !item.contains("protocol") ||
                        !item.contains("ip") || !item["port"].is_number_integer() || !item["protocol"].is_string() ||
                        !item["ip"].is_string() || item["port"].get<std::int64_t>() < 0 ||
                        item["port"].get<std::int64_t>() > 65535) {
                        return FieldOutcome::malformed(fmt::format("{} has a malformed binding {}", meta->name,
                                                                   item.dump()));
                    }
                    add_unique(bindings, item.get<Binding>());
                }
                return FieldOutcome::present(json(bindings));
            }

            static std::string render(const json& value, const CellTypeMeta*) {
                if (value.empty()) return "none";
                std::vector<std::string> parts;
                parts.reserve(value.size());
                for (const auto& item : value) { parts.push_back(to_string(item.get<Binding>())); }
                return fmt::format("{}", fmt::join(parts, ", "));
            }

            static constexpr CellOps make_ops() { return CellOps{&normalize, &render, &normalised_to_json}; }
        };

        constexpr CellOps plain_ops = CellOpsFor<CellKind::Plain>::make_ops();
        constexpr CellOps float_ops = CellOpsFor<CellKind::Float>::make_ops();
        constexpr CellOps duration_ops = CellOpsFor<CellKind::Duration>::make_ops();
        constexpr CellOps process_state_ops = CellOpsFor<CellKind::ProcessState>::make_ops();
        constexpr CellOps alias_list_ops = CellOpsFor<CellKind::AliasList>::make_ops();
        constexpr CellOps bindings_ops = CellOpsFor<CellKind::Bindings>::make_ops();

    } // namespace

    std::string format_duration(std::int64_t total_seconds) {
        struct Unit {
            std::int64_t seconds;
            std::string_view name;
        };
        static constexpr Unit units[] = {{86400, "day"}, {3600, "hour"}, {60, "minute"}, {1, "second"}};

        std::vector<std::string> parts;
        std::int64_t remaining = total_seconds;
        for (const auto& unit : units) {
            auto count = remaining / unit.seconds;
            remaining %= unit.seconds;
            // Once a larger unit is shown every smaller one follows, even at zero
            if (count != 0 || !parts.empty()) parts.push_back(pluralise(count, unit.name));
        }
        if (parts.empty()) return "0 seconds";
        return fmt::format("{}", fmt::join(parts, ", "));
    }

    const CellTypeMeta* plain_type() {
        static const CellTypeMeta meta{CellKind::Plain, "Plain", &plain_ops, UNKNOWN_TOKEN};
        return &meta;
    }

    const CellTypeMeta* float_type() {
        static const CellTypeMeta meta{CellKind::Float, "Float", &float_ops, UNKNOWN_TOKEN};
        return &meta;
    }

    const CellTypeMeta* duration_type() {
        static const CellTypeMeta meta{CellKind::Duration, "Uptime", &duration_ops, UNKNOWN_TOKEN};
        return &meta;
    }

    const CellTypeMeta* run_state_type() {
        static const CellTypeMeta meta{CellKind::ProcessState, "RunState", &process_state_ops, UNKNOWN_STATE_TOKEN};
        return &meta;
    }

    const CellTypeMeta* enabled_state_type() {
        static const CellTypeMeta meta{CellKind::ProcessState, "EnabledState", &process_state_ops,
                                       UNKNOWN_STATE_TOKEN};
        return &meta;
    }

    const CellTypeMeta* alias_list_type() {
        static const CellTypeMeta meta{CellKind::AliasList, "AliasList", &alias_list_ops, UNKNOWN_TOKEN};
        return &meta;
    }

    const CellTypeMeta* bindings_type() {
        static const CellTypeMeta meta{CellKind::Bindings, "Bindings", &bindings_ops, UNKNOWN_TOKEN};
        return &meta;
    }

    const CellTypeMeta* software_version_type() {
        static const CellTypeMeta meta{CellKind::Plain, "SoftwareVersion", &plain_ops, UNKNOWN_TOKEN};
        return &meta;
    }

} // namespace valinfo::value
