#include <valinfo/types/value/value_cell.h>
#include <valinfo/util/logging.h>

namespace valinfo::value {

    ValueCell ValueCell::construct(const CellTypeMeta* type, const json& raw, FieldOutcome& outcome) {
        outcome = type->ops->normalize(raw, type);
        return ValueCell{type, outcome.value, raw};
    }

    ValueCell ValueCell::wrap(const CellTypeMeta* type, const json& raw) {
        FieldOutcome outcome;
        return construct(type, raw, outcome);
    }

    FieldOutcome ValueCell::assign(const json& raw) {
        auto outcome = _type->ops->normalize(raw, _type);
        _value = outcome.value;
        _assigned = !outcome.is_unknown();
        return outcome;
    }

    std::string ValueCell::render() const noexcept {
        if (is_unknown()) return std::string{_type->unknown_token};
        try {
            return _type->ops->render(_value, _type);
        } catch (const std::exception& e) {
            log::logger()->warn("Could not render {} value {}: {}", _type->name, _value.dump(), e.what());
            return std::string{_type->unknown_token};
        }
    }

    json ValueCell::to_json() const {
        if (is_unknown()) return nullptr;
        return _type->ops->to_json(_value, _assigned ? _value : _source, _type);
    }

} // namespace valinfo::value
