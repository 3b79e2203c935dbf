#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "jsonmodel/model/field.hpp"
#include "jsonmodel/model/json_model.hpp"
#include "jsonmodel/model/model_exception.hpp"

namespace jsonmodel {

// Field holding one nested model of type M
template <typename M>
class ModelField final : public Field {
public:
    ModelField(std::string external_key, std::string internal_key)
        : Field(std::move(external_key), std::move(internal_key), Kind::MODEL) {}

    std::string nested_model_name() const override {
        return M::declared_fields().model_name();
    }

    nlohmann::json to_external(const FieldValue& value) const override {
        if (value.kind() != FieldValue::Kind::MODEL || value.is_null()) {
            throw ConversionTypeMismatch(describe() + " expects a " +
                                         nested_model_name() + " instance");
        }
        return value.model()->to_json_entity();
    }

    FieldValue from_external(const nlohmann::json& value) const override {
        return FieldValue(M::from_json_entity(value));
    }

    // Stored model, nullptr when the field was never set
    M* model(JsonModel& instance) const {
        FieldValue* value = find(instance);
        if (!value || value->is_null()) {
            return nullptr;
        }
        return cast(value->model());
    }

    const M* model(const JsonModel& instance) const {
        return model(const_cast<JsonModel&>(instance));
    }

private:
    M* cast(JsonModel* model) const {
        auto* typed = dynamic_cast<M*>(model);
        if (!typed) {
            throw ConversionTypeMismatch(describe() + " holds a " +
                                         model->model_name() + " instead of a " +
                                         nested_model_name());
        }
        return typed;
    }
};

// Field holding an ordered list of nested models of type M
template <typename M>
class ModelListField final : public Field {
public:
    ModelListField(std::string external_key, std::string internal_key)
        : Field(std::move(external_key), std::move(internal_key),
                Kind::MODEL_LIST) {}

    std::string nested_model_name() const override {
        return M::declared_fields().model_name();
    }

    nlohmann::json to_external(const FieldValue& value) const override {
        if (value.kind() != FieldValue::Kind::MODEL_LIST) {
            throw ConversionTypeMismatch(describe() + " holds a " +
                                         FieldValue::kind_name(value.kind()) +
                                         ", which is not a list of models");
        }
        nlohmann::json result = nlohmann::json::array();
        for (const auto& model : value.models()) {
            if (!model) {
                throw ConversionTypeMismatch(describe() +
                                             " contains an empty element");
            }
            result.push_back(model->to_json_entity());
        }
        return result;
    }

    FieldValue from_external(const nlohmann::json& value) const override {
        if (!value.is_array()) {
            throw ConversionTypeMismatch(describe() + " expects a json array, got " +
                                         value.type_name());
        }
        ModelList models;
        models.reserve(value.size());
        for (const auto& element : value) {
            if (!element.is_object()) {
                throw ConversionTypeMismatch(
                    describe() + " expects array elements to be json objects, got " +
                    element.type_name());
            }
            models.push_back(std::make_unique<M>(M::from_json_entity(element)));
        }
        return FieldValue(std::move(models));
    }

    // Stored models in order, empty when the field was never set
    std::vector<M*> models(JsonModel& instance) const {
        std::vector<M*> result;
        FieldValue* value = find(instance);
        if (!value || value->is_null()) {
            return result;
        }
        for (auto& model : value->models()) {
            auto* typed = dynamic_cast<M*>(model.get());
            if (!typed) {
                throw ConversionTypeMismatch(describe() + " holds an element that is not a " +
                                             nested_model_name());
            }
            result.push_back(typed);
        }
        return result;
    }

    std::vector<const M*> models(const JsonModel& instance) const {
        std::vector<const M*> result;
        for (M* model : models(const_cast<JsonModel&>(instance))) {
            result.push_back(model);
        }
        return result;
    }
};

}  // namespace jsonmodel
