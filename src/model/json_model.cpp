#include "jsonmodel/model/json_model.hpp"

#include <iterator>

#include "jsonmodel/log/logger.hpp"
#include "jsonmodel/model/model_exception.hpp"

namespace jsonmodel {

const FieldSet& JsonModel::declared_fields() {
    static const FieldSet fields("JsonModel");
    return fields;
}

nlohmann::json JsonModel::to_json_entity() const {
    nlohmann::json result = nlohmann::json::object();
    for (const Field* field : fields()) {
        const FieldValue* value = field->find(*this);
        if (!value) {
            continue;
        }
        result[field->external_key()] = field->to_external(*value);
    }
    return result;
}

bool JsonModel::is_set(const std::string& internal_key) const {
    return require_field(internal_key).is_set(*this);
}

const FieldValue& JsonModel::value(const std::string& internal_key) const {
    return require_field(internal_key).get(*this);
}

void JsonModel::set_value(const std::string& internal_key, FieldValue value) {
    require_field(internal_key).set(*this, std::move(value));
}

void JsonModel::populate(const nlohmann::json& entity) {
    const FieldSet& field_set = fields();
    if (!entity.is_object()) {
        throw InvalidInputType(field_set.model_name() +
                               " expects a json object, got " +
                               entity.type_name());
    }

    for (const Field* field : field_set) {
        auto it = entity.find(field->external_key());
        if (it == entity.end()) {
            continue;
        }
        field->store(*this, field->from_external(*it));
    }

    if (entity.size() > values_.size()) {
        for (const auto& item : entity.items()) {
            if (!field_set.find_by_external_key(item.key())) {
                JSONMODEL_LOG_TRACE << field_set.model_name()
                                    << " ignores unknown json key '"
                                    << item.key() << "'";
            }
        }
    }
}

void JsonModel::copy_declared_values(const JsonModel& other) {
    const FieldSet& field_set = fields();
    for (const auto& [key, value] : other.values_) {
        if (field_set.find_by_internal_key(key) && !values_.count(key)) {
            values_.emplace(key, value);
        }
    }
}

void JsonModel::take_declared_values(JsonModel& other) {
    const FieldSet& field_set = fields();
    for (auto it = other.values_.begin(); it != other.values_.end();) {
        auto next = std::next(it);
        if (field_set.find_by_internal_key(it->first)) {
            values_.insert(other.values_.extract(it));
        }
        it = next;
    }
}

void JsonModel::assign_declared_values(const JsonModel& other) {
    const FieldSet& field_set = fields();
    std::unordered_map<std::string, FieldValue> values;
    for (const auto& [key, value] : other.values_) {
        if (field_set.find_by_internal_key(key)) {
            values.emplace(key, value);
        }
    }
    values_.swap(values);
}

void JsonModel::assign_declared_values(JsonModel&& other) {
    values_.clear();
    take_declared_values(other);
}

const Field& JsonModel::require_field(const std::string& internal_key) const {
    const Field* field = fields().find_by_internal_key(internal_key);
    if (!field) {
        throw UnknownFieldError(model_name() + " has no field named '" +
                                internal_key + "'");
    }
    return *field;
}

}  // namespace jsonmodel
