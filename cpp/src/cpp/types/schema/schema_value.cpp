#include <valinfo/types/schema/schema_value.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/logging.h>

#include <iterator>
#include <utility>

namespace valinfo::schema {

    namespace {
        std::string join_path(std::string_view prefix, std::string_view name) {
            return prefix.empty() ? std::string{name} : fmt::format("{}.{}", prefix, name);
        }
    } // namespace

    SchemaValue SchemaValue::build(const json& raw, const SchemaNode& schema, bool verbose) {
        SchemaValue result{schema, verbose};
        result.build_fields(raw, {});
        return result;
    }

    std::unique_ptr<SchemaValue> SchemaValue::make_nested(const SchemaNode& schema, bool verbose) {
        return std::unique_ptr<SchemaValue>(new SchemaValue(schema, verbose));
    }

    void SchemaValue::build_fields(const json& raw, std::string_view path_prefix) {
        static const json missing;

        const bool usable = raw.is_object();
        if (!usable && !raw.is_null()) {
            auto msg = fmt::format("expected an object, got {}", raw.type_name());
            log::logger()->warn("Could not build {} at '{}': {}", _schema->type_name(),
                                path_prefix.empty() ? "<root>" : path_prefix, msg);
            _errors.push_back({std::string{path_prefix}, _schema->type_name(), std::move(msg)});
        }

        _members.reserve(_schema->field_count());
        for (const auto& field : _schema->fields()) {
            const json* field_raw = &missing;
            if (usable) {
                auto it = raw.find(field.name);
                if (it != raw.end()) field_raw = &*it;
            }

            auto path = join_path(path_prefix, field.name);
            if (field.is_nested()) {
                auto child = make_nested(*field.nested(), _verbose);
                child->build_fields(*field_raw, path);
                _members.emplace_back(std::move(child));
                continue;
            }

            value::FieldOutcome outcome;
            auto cell = value::ValueCell::construct(field.cell_type(), *field_raw, outcome);
            if (!outcome.ok()) {
                log::logger()->warn("Field '{}' of {} set to unknown: {}", field.name, _schema->type_name(),
                                    outcome.error);
                _errors.push_back({std::move(path), _schema->type_name(), std::move(outcome.error)});
            }
            _members.emplace_back(std::move(cell));
        }
    }

    const value::ValueCell* SchemaValue::cell(std::string_view name) const {
        auto index = _schema->index_of(name);
        if (!index) return nullptr;
        return std::get_if<value::ValueCell>(&_members[*index]);
    }

    value::ValueCell* SchemaValue::cell(std::string_view name) {
        return const_cast<value::ValueCell*>(std::as_const(*this).cell(name));
    }

    const SchemaValue* SchemaValue::node(std::string_view name) const {
        auto index = _schema->index_of(name);
        if (!index) return nullptr;
        auto child = std::get_if<std::unique_ptr<SchemaValue>>(&_members[*index]);
        return child ? child->get() : nullptr;
    }

    SchemaValue* SchemaValue::node(std::string_view name) {
        return const_cast<SchemaValue*>(std::as_const(*this).node(name));
    }

    const value::ValueCell* SchemaValue::cell_at(std::initializer_list<std::string_view> path) const {
        if (path.size() == 0) return nullptr;
        const SchemaValue* current = this;
        auto it = path.begin();
        for (; std::next(it) != path.end(); ++it) {
            current = current->node(*it);
            if (current == nullptr) return nullptr;
        }
        return current->cell(*it);
    }

    bool SchemaValue::is_unknown() const {
        for (const auto& member : _members) {
            if (auto c = std::get_if<value::ValueCell>(&member)) {
                if (!c->is_unknown()) return false;
            } else if (!std::get<std::unique_ptr<SchemaValue>>(member)->is_unknown()) {
                return false;
            }
        }
        return true;
    }

    void SchemaValue::enrich(enrichment::EnrichmentContext& context) {
        for (size_t i = 0; i < _members.size(); ++i) {
            const auto& field = _schema->fields()[i];
            if (auto child = std::get_if<std::unique_ptr<SchemaValue>>(&_members[i])) {
                (*child)->enrich(context);
                continue;
            }
            if (field.enricher == nullptr) continue;

            auto& c = std::get<value::ValueCell>(_members[i]);
            if (!field.enricher->wants(c)) continue;
            try {
                field.enricher->enrich(field.name, c, context);
            } catch (const ProbeFailure& e) {
                log::logger()->warn("{} could not enrich field '{}' of {}: {}", field.enricher->name(), field.name,
                                    _schema->type_name(), e.what());
            }
        }
    }

    json SchemaValue::to_json() const {
        json out = json::object();
        for (size_t i = 0; i < _members.size(); ++i) {
            const auto& member = _members[i];
            if (auto c = std::get_if<value::ValueCell>(&member)) {
                out[name_at(i)] = c->to_json();
            } else {
                out[name_at(i)] = std::get<std::unique_ptr<SchemaValue>>(member)->to_json();
            }
        }
        return out;
    }

    std::vector<FieldError> SchemaValue::errors() const {
        std::vector<FieldError> out;
        collect_errors(out);
        return out;
    }

    void SchemaValue::collect_errors(std::vector<FieldError>& out) const {
        out.insert(out.end(), _errors.begin(), _errors.end());
        for (const auto& member : _members) {
            if (auto child = std::get_if<std::unique_ptr<SchemaValue>>(&member)) (*child)->collect_errors(out);
        }
    }

} // namespace valinfo::schema
