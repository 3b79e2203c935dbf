#include "jsonmodel/model/field.hpp"

#include "jsonmodel/model/json_model.hpp"
#include "jsonmodel/model/model_exception.hpp"

namespace jsonmodel {

Field::Field(std::string external_key, std::string internal_key, Kind kind)
    : external_key_(std::move(external_key)),
      internal_key_(std::move(internal_key)),
      kind_(kind) {}

const char* Field::kind_name(Kind kind) {
    switch (kind) {
        case Kind::SCALAR:
            return "scalar";
        case Kind::MODEL:
            return "model";
        case Kind::MODEL_LIST:
            return "model list";
        default:
            return "unknown";
    }
}

const FieldValue& Field::get(const JsonModel& instance) const {
    static const FieldValue empty;
    const FieldValue* value = find(instance);
    return value ? *value : empty;
}

void Field::set(JsonModel& instance, FieldValue value) const {
    instance.values_.insert_or_assign(internal_key_, std::move(value));
}

bool Field::is_set(const JsonModel& instance) const {
    return find(instance) != nullptr;
}

FieldValue* Field::find(JsonModel& instance) const {
    auto it = instance.values_.find(internal_key_);
    return it != instance.values_.end() ? &it->second : nullptr;
}

const FieldValue* Field::find(const JsonModel& instance) const {
    auto it = instance.values_.find(internal_key_);
    return it != instance.values_.end() ? &it->second : nullptr;
}

void Field::store(JsonModel& instance, FieldValue value) const {
    instance.values_.insert_or_assign(internal_key_, std::move(value));
}

std::string Field::describe() const {
    return std::string(kind_name(kind_)) + " field '" + internal_key_ +
           "' (json key '" + external_key_ + "')";
}

ScalarField::ScalarField(std::string external_key, std::string internal_key)
    : Field(std::move(external_key), std::move(internal_key), Kind::SCALAR) {}

nlohmann::json ScalarField::to_external(const FieldValue& value) const {
    if (value.kind() != FieldValue::Kind::JSON) {
        throw ConversionTypeMismatch(describe() + " holds a " +
                                     FieldValue::kind_name(value.kind()) +
                                     " instead of a json value");
    }
    return value.json();
}

FieldValue ScalarField::from_external(const nlohmann::json& value) const {
    return FieldValue(value);
}

}  // namespace jsonmodel
