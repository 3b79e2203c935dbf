#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "jsonmodel/model/field.hpp"
#include "jsonmodel/model/field_set.hpp"
#include "jsonmodel/model/field_value.hpp"

namespace jsonmodel {

// One keyword-style initializer for Model::create
struct FieldInitializer {
    std::string name;
    FieldValue value;
};

/**
 * @brief Root of every model type
 *
 * Holds the sparse storage of explicitly set field values, keyed by internal
 * key. A key that is absent was never set; a key mapped to a JSON null was
 * set to null. Concrete models derive from Model<Derived, Base>, which wires
 * in the type's FieldSet.
 */
class JsonModel {
public:
    virtual ~JsonModel() = default;

    // Type whose JSONMODEL_FIELDS declared the visible declared_fields()
    using declared_model = JsonModel;

    // Field set of the root type, which declares nothing
    static const FieldSet& declared_fields();

    // Field set of the dynamic type, ancestors included
    virtual const FieldSet& fields() const = 0;
    virtual std::unique_ptr<JsonModel> clone() const = 0;

    const std::string& model_name() const { return fields().model_name(); }

    /**
     * @brief Convert to a JSON object ready for encoding
     *
     * Every field that was set is written under its external key; fields
     * that were never set are left out. Throws ConversionTypeMismatch when a
     * stored value does not fit its field.
     */
    nlohmann::json to_json_entity() const;

    bool is_set(const std::string& internal_key) const;
    const FieldValue& value(const std::string& internal_key) const;
    void set_value(const std::string& internal_key, FieldValue value);
    std::size_t set_field_count() const { return values_.size(); }

protected:
    // Storage is transferred by Model, one hierarchy level at a time, so a
    // copy only keeps the fields its own type declares
    JsonModel() = default;
    JsonModel(const JsonModel&) {}
    JsonModel(JsonModel&&) {}
    JsonModel& operator=(const JsonModel&) = delete;
    JsonModel& operator=(JsonModel&&) = delete;

    // Fill storage from a JSON object, ignoring keys no field is bound to
    void populate(const nlohmann::json& entity);

    // Add the values of other whose fields belong to fields(). During
    // construction fields() is the set of the level being built.
    void copy_declared_values(const JsonModel& other);
    void take_declared_values(JsonModel& other);

    // Replace storage with the values of other that fields() declares
    void assign_declared_values(const JsonModel& other);
    void assign_declared_values(JsonModel&& other);

    const Field& require_field(const std::string& internal_key) const;

private:
    friend class Field;

    std::unordered_map<std::string, FieldValue> values_;
};

/**
 * @brief CRTP base for concrete model types
 *
 * Base is either JsonModel or another model type, in which case the derived
 * model inherits the parent's fields. Derived declares its own fields with the
 * JSONMODEL_* macros from jsonmodel/model/macros.hpp and must name itself
 * through JSONMODEL_FIELDS, even with an empty field list.
 *
 * Copying a derived model into a base model keeps only the base's fields.
 */
template <typename Derived, typename Base = JsonModel>
class Model : public Base {
public:
    using parent_model = Base;

    Model() {
        static_assert(std::is_same_v<typename Derived::declared_model, Derived>,
                      "every model type must declare JSONMODEL_FIELDS");
    }

    Model(const Model& other) : Base(other) { this->copy_declared_values(other); }
    Model(Model&& other) : Base(std::move(other)) { this->take_declared_values(other); }

    Model& operator=(const Model& other) {
        if (this != &other) {
            this->assign_declared_values(other);
        }
        return *this;
    }

    Model& operator=(Model&& other) {
        if (this != &other) {
            this->assign_declared_values(std::move(other));
        }
        return *this;
    }

    const FieldSet& fields() const override { return Derived::declared_fields(); }

    std::unique_ptr<JsonModel> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

    /**
     * @brief Build an instance from a parsed JSON object
     *
     * Throws InvalidInputType when entity is not an object. Keys that match
     * no declared field are ignored.
     */
    static Derived from_json_entity(const nlohmann::json& entity) {
        Derived instance;
        instance.populate(entity);
        return instance;
    }

    // Keyword-style construction, each value goes through the field's set()
    static Derived create(std::initializer_list<FieldInitializer> initializers) {
        Derived instance;
        for (const auto& initializer : initializers) {
            instance.set_value(initializer.name, initializer.value);
        }
        return instance;
    }
};

}  // namespace jsonmodel
