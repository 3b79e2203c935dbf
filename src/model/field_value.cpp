#include "jsonmodel/model/field_value.hpp"

#include "jsonmodel/model/json_model.hpp"
#include "jsonmodel/model/model_exception.hpp"

namespace jsonmodel {

namespace {

ModelList clone_list(const ModelList& models) {
    ModelList copy;
    copy.reserve(models.size());
    for (const auto& model : models) {
        copy.push_back(model ? model->clone() : nullptr);
    }
    return copy;
}

}  // namespace

FieldValue::FieldValue() : data_(std::in_place_type<nlohmann::json>) {}

FieldValue::FieldValue(nlohmann::json value)
    : data_(std::in_place_type<nlohmann::json>, std::move(value)) {}

FieldValue::FieldValue(ModelPtr model)
    : data_(std::in_place_type<ModelPtr>, std::move(model)) {}

FieldValue::FieldValue(ModelList models)
    : data_(std::in_place_type<ModelList>, std::move(models)) {}

FieldValue::FieldValue(const FieldValue& other) {
    switch (other.kind()) {
        case Kind::JSON:
            data_.emplace<nlohmann::json>(std::get<nlohmann::json>(other.data_));
            break;
        case Kind::MODEL: {
            const auto& model = std::get<ModelPtr>(other.data_);
            data_.emplace<ModelPtr>(model ? model->clone() : nullptr);
            break;
        }
        case Kind::MODEL_LIST:
            data_.emplace<ModelList>(clone_list(std::get<ModelList>(other.data_)));
            break;
    }
}

FieldValue::FieldValue(FieldValue&& other) noexcept = default;

FieldValue& FieldValue::operator=(const FieldValue& other) {
    if (this != &other) {
        FieldValue copy(other);
        data_ = std::move(copy.data_);
    }
    return *this;
}

FieldValue& FieldValue::operator=(FieldValue&& other) noexcept = default;

FieldValue::~FieldValue() = default;

FieldValue::Kind FieldValue::kind() const {
    return static_cast<Kind>(data_.index());
}

const char* FieldValue::kind_name(Kind kind) {
    switch (kind) {
        case Kind::JSON:
            return "json";
        case Kind::MODEL:
            return "model";
        case Kind::MODEL_LIST:
            return "model list";
        default:
            return "unknown";
    }
}

bool FieldValue::is_null() const {
    switch (kind()) {
        case Kind::JSON:
            return std::get<nlohmann::json>(data_).is_null();
        case Kind::MODEL:
            return std::get<ModelPtr>(data_) == nullptr;
        default:
            return false;
    }
}

const nlohmann::json& FieldValue::json() const {
    if (auto* value = std::get_if<nlohmann::json>(&data_)) {
        return *value;
    }
    throw ConversionTypeMismatch(std::string("expected a json value, holding a ") +
                                 kind_name(kind()));
}

JsonModel* FieldValue::model() {
    if (auto* value = std::get_if<ModelPtr>(&data_)) {
        return value->get();
    }
    throw ConversionTypeMismatch(std::string("expected a model, holding a ") +
                                 kind_name(kind()));
}

const JsonModel* FieldValue::model() const {
    return const_cast<FieldValue*>(this)->model();
}

ModelList& FieldValue::models() {
    if (auto* value = std::get_if<ModelList>(&data_)) {
        return *value;
    }
    throw ConversionTypeMismatch(
        std::string("expected a model list, holding a ") + kind_name(kind()));
}

const ModelList& FieldValue::models() const {
    return const_cast<FieldValue*>(this)->models();
}

}  // namespace jsonmodel
