#include <valinfo/types/schema/schema_node.h>
#include <valinfo/util/errors.h>

namespace valinfo::schema {

    const SchemaField* SchemaNode::field_by_name(std::string_view name) const {
        auto index = index_of(name);
        return index ? &_fields[*index] : nullptr;
    }

    std::optional<size_t> SchemaNode::index_of(std::string_view name) const {
        auto it = _name_to_index.find(std::string{name});
        if (it == _name_to_index.end()) return std::nullopt;
        return it->second;
    }

    SchemaNodeBuilder& SchemaNodeBuilder::add_field(std::string name, const value::CellTypeMeta* type,
                                                    const enrichment::FieldEnricher* enricher) {
        _pending_fields.push_back({std::move(name), FieldKind{type}, enricher});
        return *this;
    }

    SchemaNodeBuilder& SchemaNodeBuilder::add_field(std::string name, const SchemaNode* nested) {
        _pending_fields.push_back({std::move(name), FieldKind{nested}, nullptr});
        return *this;
    }

    std::unique_ptr<SchemaNode> SchemaNodeBuilder::build(std::string type_name) {
        auto node = std::make_unique<SchemaNode>();
        node->_type_name = std::move(type_name);
        node->_fields.reserve(_pending_fields.size());

        for (auto& field : _pending_fields) {
            if (field.name.empty()) {
                throw_error<std::invalid_argument>("Schema '{}' declares a field with an empty name", node->_type_name);
            }
            bool null_kind = field.is_nested() ? field.nested() == nullptr : field.cell_type() == nullptr;
            if (null_kind) {
                throw_error<std::invalid_argument>("Schema '{}' field '{}' has no type", node->_type_name, field.name);
            }
            auto [_, inserted] = node->_name_to_index.emplace(field.name, node->_fields.size());
            if (!inserted) {
                throw_error<std::invalid_argument>("Schema '{}' declares field '{}' twice", node->_type_name,
                                                   field.name);
            }
            node->_fields.push_back(std::move(field));
        }
        _pending_fields.clear();
        return node;
    }

} // namespace valinfo::schema
