#pragma once

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

#include "jsonmodel/model/field.hpp"
#include "jsonmodel/model/field_set.hpp"
#include "jsonmodel/model/json_model.hpp"
#include "jsonmodel/model/model_field.hpp"

// Field declaration macros, used inside the public section of a model:
//
//   class Address : public jsonmodel::Model<Address> {
//   public:
//       JSONMODEL_PROPERTY(street, "Street")
//       JSONMODEL_PROPERTY(city, "City")
//       JSONMODEL_FIELDS(Address, street, city)
//   };
//
// Each property generates a shared descriptor name_field() plus name() and
// set_name() accessors. JSONMODEL_FIELDS names the model and lists its own
// fields in order. Every model type needs it; a subclass adding no fields
// writes JSONMODEL_FIELDS(Type).

// Plain JSON value
#define JSONMODEL_PROPERTY(name, external_key)                                 \
    static const ::jsonmodel::ScalarField& name##_field() {                    \
        static const ::jsonmodel::ScalarField field(external_key, #name);      \
        return field;                                                          \
    }                                                                          \
    const ::nlohmann::json& name() const {                                     \
        return name##_field().get(*this).json();                               \
    }                                                                          \
    void set_##name(::nlohmann::json value) {                                  \
        name##_field().set(*this, ::jsonmodel::FieldValue(std::move(value)));  \
    }

// One nested model, name() is nullptr until set
#define JSONMODEL_MODEL_PROPERTY(name, external_key, ModelType)                \
    static const ::jsonmodel::ModelField<ModelType>& name##_field() {          \
        static const ::jsonmodel::ModelField<ModelType> field(external_key,    \
                                                              #name);          \
        return field;                                                          \
    }                                                                          \
    ModelType* name() { return name##_field().model(*this); }                  \
    const ModelType* name() const { return name##_field().model(*this); }      \
    void set_##name(ModelType value) {                                         \
        name##_field().set(*this, ::jsonmodel::FieldValue(std::move(value)));  \
    }                                                                          \
    void set_##name(std::unique_ptr<ModelType> value) {                        \
        name##_field().set(                                                    \
            *this, ::jsonmodel::FieldValue(::jsonmodel::ModelPtr(std::move(value)))); \
    }

// Ordered list of nested models, name() is empty until set
#define JSONMODEL_MODEL_LIST_PROPERTY(name, external_key, ModelType)           \
    static const ::jsonmodel::ModelListField<ModelType>& name##_field() {      \
        static const ::jsonmodel::ModelListField<ModelType> field(external_key,\
                                                                  #name);      \
        return field;                                                          \
    }                                                                          \
    std::vector<ModelType*> name() { return name##_field().models(*this); }    \
    std::vector<const ModelType*> name() const {                               \
        return name##_field().models(*this);                                   \
    }                                                                          \
    void set_##name(std::vector<ModelType> values) {                           \
        name##_field().set(*this, ::jsonmodel::FieldValue(std::move(values))); \
    }

#define JSONMODEL_DETAIL_FIELD_ENTRY(r, data, name) &BOOST_PP_CAT(name, _field)(),

// Ordered field set of Type: inherited fields first, then the listed ones
#define JSONMODEL_FIELDS(Type, ...)                                            \
    using declared_model = Type;                                               \
    static const ::jsonmodel::FieldSet& declared_fields() {                    \
        static const ::jsonmodel::FieldSet fields(                             \
            #Type, parent_model::declared_fields(),                            \
            {__VA_OPT__(BOOST_PP_SEQ_FOR_EACH(                                 \
                JSONMODEL_DETAIL_FIELD_ENTRY, ~,                               \
                BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))});                     \
        return fields;                                                         \
    }
