#pragma once

/**
 * @file value_cell.h
 * @brief A typed, nullable leaf value of a record.
 *
 * A cell is unknown iff its normalised value is null. Falsy values (0, false, an empty list) are present values.
 * The raw input the cell was constructed from is kept as the source, enrichment uses it to derive a value for a
 * cell that could not be normalised directly (e.g. a stored port number that becomes a list of bindings).
 * Canonical JSON writes the stored source back out unchanged, normalisation only affects rendering. A value
 * supplied by enrichment has no stored source and is written in its normalised form.
 */

#include <valinfo/types/value/cell_type.h>

#include <string>

namespace valinfo::value {

    class ValueCell {
    public:
        // An unknown cell of the given type
        explicit ValueCell(const CellTypeMeta* type) : _type{type} {}

        /**
         * Construct from a raw value, returning the outcome of the normalisation alongside the cell. The cell is
         * unknown when the outcome is unknown or malformed.
         */
        static ValueCell construct(const CellTypeMeta* type, const json& raw, FieldOutcome& outcome);

        // Construct, discarding any error (the cell is simply unknown on malformed input)
        static ValueCell wrap(const CellTypeMeta* type, const json& raw);

        [[nodiscard]] bool is_unknown() const { return _value.is_null(); }

        [[nodiscard]] const json& raw_value() const { return _value; }
        [[nodiscard]] const json& source() const { return _source; }

        [[nodiscard]] const CellTypeMeta* type() const { return _type; }
        [[nodiscard]] CellKind kind() const { return _type->kind; }

        /**
         * Replace the value, normalising it with this cell's type. Used by enrichment. The source is left as-is so
         * the cell still reflects what was stored.
         */
        [[nodiscard]] FieldOutcome assign(const json& raw);

        [[nodiscard]] bool is_assigned() const { return _assigned; }

        void reset() {
            _value = nullptr;
            _assigned = false;
        }

        /**
         * Human readable form. Never throws, a formatting failure is logged and yields the unknown token.
         */
        [[nodiscard]] std::string render() const noexcept;

        // Canonical JSON form, null when unknown, otherwise the stored source as the kind writes it
        [[nodiscard]] json to_json() const;

    private:
        ValueCell(const CellTypeMeta* type, json value, json source)
            : _type(type), _value(std::move(value)), _source(std::move(source)) {}

        const CellTypeMeta* _type;
        json _value;
        json _source;
        bool _assigned{false};
    };

} // namespace valinfo::value
