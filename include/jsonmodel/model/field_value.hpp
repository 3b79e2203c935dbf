#pragma once

#include <concepts>
#include <memory>
#include <nlohmann/json.hpp>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmodel {

class JsonModel;

using ModelPtr = std::unique_ptr<JsonModel>;
using ModelList = std::vector<ModelPtr>;

namespace detail {

template <typename T>
concept ModelType = std::is_class_v<T> && std::is_base_of_v<JsonModel, T>;

template <typename T>
struct is_model_vector : std::false_type {};

template <ModelType M, typename A>
struct is_model_vector<std::vector<M, A>> : std::true_type {};

template <typename T>
concept JsonCompatible =
    !is_model_vector<std::remove_cvref_t<T>>::value &&
    !std::is_same_v<std::remove_cvref_t<T>, nlohmann::json> &&
    !std::is_same_v<std::remove_cvref_t<T>, ModelPtr> &&
    !std::is_same_v<std::remove_cvref_t<T>, ModelList> &&
    std::is_constructible_v<nlohmann::json, T>;

}  // namespace detail

/**
 * @brief Value held in a model's storage for one field
 *
 * Either a plain JSON value (scalar fields, explicit nulls), one nested model
 * or an ordered list of nested models. Nested models are owned exclusively;
 * copying a FieldValue deep-copies them.
 */
class FieldValue {
public:
    enum class Kind { JSON, MODEL, MODEL_LIST };

    FieldValue();
    FieldValue(nlohmann::json value);
    FieldValue(ModelPtr model);
    FieldValue(ModelList models);

    template <typename T>
        requires detail::JsonCompatible<T> && (!detail::ModelType<std::remove_cvref_t<T>>) &&
                 (!std::is_same_v<std::remove_cvref_t<T>, FieldValue>)
    FieldValue(T&& value) : FieldValue(nlohmann::json(std::forward<T>(value))) {}

    template <detail::ModelType M>
    FieldValue(M model)
        : data_(std::in_place_type<ModelPtr>,
                std::make_unique<M>(std::move(model))) {}

    template <detail::ModelType M>
    FieldValue(std::vector<M> models) : data_(ModelList{}) {
        auto& list = std::get<ModelList>(data_);
        list.reserve(models.size());
        for (auto& model : models) {
            list.push_back(std::make_unique<M>(std::move(model)));
        }
    }

    FieldValue(const FieldValue& other);
    FieldValue(FieldValue&& other) noexcept;
    FieldValue& operator=(const FieldValue& other);
    FieldValue& operator=(FieldValue&& other) noexcept;
    ~FieldValue();

    Kind kind() const;
    static const char* kind_name(Kind kind);

    // True for a JSON null or an empty model pointer
    bool is_null() const;

    // Accessors throw ConversionTypeMismatch when the value is another kind
    const nlohmann::json& json() const;
    JsonModel* model();
    const JsonModel* model() const;
    ModelList& models();
    const ModelList& models() const;

private:
    std::variant<nlohmann::json, ModelPtr, ModelList> data_;
};

}  // namespace jsonmodel
