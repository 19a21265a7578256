#pragma once

/**
 * @file schema_value.h
 * @brief The typed tree built from one raw record by a SchemaNode.
 *
 * Each field is constructed independently: a field whose input is malformed is logged, recorded as a FieldError and
 * left unknown, the rest of the record is unaffected. The tree keeps the schema's field order for rendering and
 * supports keyed lookup by field name.
 */

#include <valinfo/types/schema/schema_node.h>
#include <valinfo/types/value/value_cell.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace valinfo::schema {

    struct FieldError {
        std::string path;       // dotted path of the field within the record
        std::string type_name;  // schema type that declares the field
        std::string message;
    };

    class SchemaValue {
    public:
        using Member = std::variant<value::ValueCell, std::unique_ptr<SchemaValue>>;

        /**
         * Build the typed tree for raw (a JSON object, or null meaning "no data for this record") against schema.
         * Nested schemas are built with the same verbose flag.
         */
        static SchemaValue build(const json& raw, const SchemaNode& schema, bool verbose);

        SchemaValue(SchemaValue&&) noexcept = default;
        SchemaValue& operator=(SchemaValue&&) noexcept = default;

        [[nodiscard]] const SchemaNode& schema() const { return *_schema; }
        [[nodiscard]] bool verbose() const { return _verbose; }

        [[nodiscard]] size_t size() const { return _members.size(); }
        [[nodiscard]] const std::string& name_at(size_t i) const { return _schema->fields()[i].name; }
        [[nodiscard]] const Member& at(size_t i) const { return _members[i]; }

        // Keyed lookup, nullptr when the name is not declared or is declared with the other kind
        [[nodiscard]] const value::ValueCell* cell(std::string_view name) const;
        [[nodiscard]] value::ValueCell* cell(std::string_view name);
        [[nodiscard]] const SchemaValue* node(std::string_view name) const;
        [[nodiscard]] SchemaValue* node(std::string_view name);

        // Walks nested nodes by name, the last name must be a cell. nullptr when any step does not resolve.
        [[nodiscard]] const value::ValueCell* cell_at(std::initializer_list<std::string_view> path) const;

        // Unknown when every cell below this node is unknown
        [[nodiscard]] bool is_unknown() const;

        /**
         * Offer each field carrying an enricher to it. ProbeFailure raised by an enricher is logged and leaves that
         * one field as it was.
         */
        void enrich(enrichment::EnrichmentContext& context);

        // Canonical JSON, unknown cells as null
        [[nodiscard]] json to_json() const;

        // Construction errors of this node and all nested nodes
        [[nodiscard]] std::vector<FieldError> errors() const;

    private:
        SchemaValue(const SchemaNode& schema, bool verbose) : _schema{&schema}, _verbose{verbose} {}

        // Nested members are held by unique_ptr
        static std::unique_ptr<SchemaValue> make_nested(const SchemaNode& schema, bool verbose);

        void build_fields(const json& raw, std::string_view path_prefix);
        void collect_errors(std::vector<FieldError>& out) const;

        const SchemaNode* _schema;
        bool _verbose;
        std::vector<Member> _members;
        std::vector<FieldError> _errors;
    };

} // namespace valinfo::schema
