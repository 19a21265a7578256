#pragma once

/**
 * @file schema_node.h
 * @brief Declarative, recursively composable record shapes.
 *
 * A SchemaNode is an ordered list of (field name, kind) pairs where the kind is either a cell type or another
 * SchemaNode. Schemas are built and validated once, then used to turn loosely structured JSON into a SchemaValue.
 *
 * Usage:
 * @code
 * auto metrics = SchemaNodeBuilder()
 *     .add_field("uptime", value::duration_type())
 *     .build("Metrics");
 *
 * auto node_info = SchemaNodeBuilder()
 *     .add_field("Name", value::plain_type())
 *     .add_field("Metrics", metrics.get())
 *     .build("NodeInfo");
 * @endcode
 */

#include <valinfo/enrichment/field_enricher.h>
#include <valinfo/types/value/cell_type.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace valinfo::schema {

    class SchemaNode;

    using FieldKind = std::variant<const value::CellTypeMeta*, const SchemaNode*>;

    struct SchemaField {
        std::string name;
        FieldKind kind;
        const enrichment::FieldEnricher* enricher{nullptr};

        [[nodiscard]] bool is_nested() const { return std::holds_alternative<const SchemaNode*>(kind); }
        [[nodiscard]] const SchemaNode* nested() const { return std::get<const SchemaNode*>(kind); }
        [[nodiscard]] const value::CellTypeMeta* cell_type() const {
            return std::get<const value::CellTypeMeta*>(kind);
        }
    };

    class SchemaNode {
    public:
        [[nodiscard]] const std::string& type_name() const { return _type_name; }

        [[nodiscard]] size_t field_count() const { return _fields.size(); }

        [[nodiscard]] const std::vector<SchemaField>& fields() const { return _fields; }

        [[nodiscard]] const SchemaField* field_by_index(size_t i) const {
            return i < _fields.size() ? &_fields[i] : nullptr;
        }

        [[nodiscard]] const SchemaField* field_by_name(std::string_view name) const;

        [[nodiscard]] std::optional<size_t> index_of(std::string_view name) const;

    private:
        friend class SchemaNodeBuilder;

        std::string _type_name;
        std::vector<SchemaField> _fields;
        std::unordered_map<std::string, size_t> _name_to_index;
    };

    /**
     * SchemaNodeBuilder - Builds a SchemaNode from field specifications
     *
     * build() rejects empty or duplicate field names and null kinds with std::invalid_argument.
     */
    class SchemaNodeBuilder {
    public:
        SchemaNodeBuilder() = default;

        SchemaNodeBuilder& add_field(std::string name, const value::CellTypeMeta* type,
                                     const enrichment::FieldEnricher* enricher = nullptr);

        SchemaNodeBuilder& add_field(std::string name, const SchemaNode* nested);

        std::unique_ptr<SchemaNode> build(std::string type_name);

    private:
        std::vector<SchemaField> _pending_fields;
    };

} // namespace valinfo::schema
