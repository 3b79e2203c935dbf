#include "jsonmodel/model/field_set.hpp"

#include <algorithm>
#include <unordered_set>

#include "jsonmodel/log/logger.hpp"
#include "jsonmodel/model/model_exception.hpp"

namespace jsonmodel {

FieldSet::FieldSet(std::string model_name) : model_name_(std::move(model_name)) {}

FieldSet::FieldSet(std::string model_name, const FieldSet& parent,
                   std::initializer_list<const Field*> own_fields)
    : model_name_(std::move(model_name)), fields_(parent.fields_) {
    std::unordered_set<std::string> own_internal_keys;
    std::unordered_set<std::string> own_external_keys;

    for (const Field* field : own_fields) {
        if (!own_internal_keys.insert(field->internal_key()).second) {
            throw ModelDefinitionError(model_name_ + " declares field '" +
                                       field->internal_key() + "' twice");
        }
        if (!own_external_keys.insert(field->external_key()).second) {
            throw ModelDefinitionError(model_name_ +
                                       " binds more than one field to json key '" +
                                       field->external_key() + "'");
        }

        auto shadowed = std::find_if(
            fields_.begin(), fields_.end(), [field](const Field* inherited) {
                return inherited->internal_key() == field->internal_key();
            });
        if (shadowed != fields_.end()) {
            JSONMODEL_LOG_DEBUG << model_name_ << "." << field->internal_key()
                                << " overrides the field inherited from "
                                << parent.model_name();
            *shadowed = field;
        } else {
            fields_.push_back(field);
        }
    }

    index();
}

const Field* FieldSet::find_by_internal_key(const std::string& internal_key) const {
    auto it = by_internal_key_.find(internal_key);
    return it != by_internal_key_.end() ? it->second : nullptr;
}

const Field* FieldSet::find_by_external_key(const std::string& external_key) const {
    auto it = by_external_key_.find(external_key);
    return it != by_external_key_.end() ? it->second : nullptr;
}

void FieldSet::index() {
    for (const Field* field : fields_) {
        by_internal_key_.emplace(field->internal_key(), field);
        auto [it, inserted] = by_external_key_.emplace(field->external_key(), field);
        if (!inserted) {
            throw ModelDefinitionError(
                model_name_ + " binds fields '" + it->second->internal_key() +
                "' and '" + field->internal_key() + "' to the same json key '" +
                field->external_key() + "'");
        }
    }
}

}  // namespace jsonmodel
