#pragma once

/**
 * @file cell_type.h
 * @brief Type metadata for the leaf values (cells) of a record.
 *
 * Every cell kind is described by a CellTypeMeta carrying a table of function pointers (CellOps), the same
 * type-erased dispatch used for the record schema. A cell holds a JSON value that has already been normalised by
 * its kind; the kind decides how the value is rendered for people and how it is written back out as JSON.
 *
 * Usage:
 * @code
 * const CellTypeMeta* uptime = duration_type();
 * FieldOutcome outcome = uptime->ops->normalize(json(90061), uptime);
 * std::string text = uptime->ops->render(outcome.value, uptime);  // "1 day, 1 hour, 1 minute, 1 second"
 * @endcode
 */

#include <valinfo/valinfo_base.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace valinfo::value {

    struct CellTypeMeta;

    /**
     * The result of normalising one raw field value.
     *
     * - present: value holds the normalised (non-null) value
     * - unknown: value is null and error is empty (the field was absent or null)
     * - malformed: value is null and error describes what was wrong with the input
     */
    struct FieldOutcome {
        json value;
        std::string error;

        static FieldOutcome present(json v) { return {std::move(v), {}}; }
        static FieldOutcome unknown() { return {}; }
        static FieldOutcome malformed(std::string msg) { return {json(), std::move(msg)}; }

        [[nodiscard]] bool ok() const { return error.empty(); }
        [[nodiscard]] bool is_unknown() const { return value.is_null(); }
    };

    /**
     * CellOps - Function pointers for cell operations
     *
     * normalize never throws, malformed input is reported through the outcome.
     * render and to_json are only called with a non-null (normalised) value; render may throw on a value it cannot
     * format, ValueCell turns that into the unknown token.
     * to_json receives the normalised value and the stored source, most kinds write the source back unchanged.
     */
    struct CellOps {
        FieldOutcome (*normalize)(const json& raw, const CellTypeMeta* meta);
        std::string (*render)(const json& value, const CellTypeMeta* meta);
        json (*to_json)(const json& value, const json& source, const CellTypeMeta* meta);
    };

    enum class CellKind : uint8_t {
        Plain,           // Any JSON value, strings rendered verbatim
        Float,           // Number rendered with two decimals
        Duration,        // Seconds rendered as days/hours/minutes/seconds
        ProcessState,    // Run or enabled state label
        AliasList,       // De-duplicated list of node aliases, one marked line each
        Bindings,        // Listener sockets discovered for a declared port
    };

    struct CellTypeMeta {
        CellKind kind;
        const char* name;
        const CellOps* ops;
        std::string_view unknown_token;
    };

    /// Leading marker of narrative lines that are only shown in verbose mode.
    inline constexpr std::string_view VERBOSE_MARKER = "#";

    inline constexpr std::string_view UNKNOWN_TOKEN = "Unknown";
    inline constexpr std::string_view UNKNOWN_STATE_TOKEN = "in unknown state";

    // ========== Built-in cell types ==========

    const CellTypeMeta* plain_type();
    const CellTypeMeta* float_type();
    const CellTypeMeta* duration_type();
    const CellTypeMeta* run_state_type();
    const CellTypeMeta* enabled_state_type();
    const CellTypeMeta* alias_list_type();
    const CellTypeMeta* bindings_type();
    const CellTypeMeta* software_version_type();

    // Exposed for tests and the narrative renderer.
    [[nodiscard]] std::string format_duration(std::int64_t total_seconds);

} // namespace valinfo::value
