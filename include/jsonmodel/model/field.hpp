#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "jsonmodel/model/field_value.hpp"

namespace jsonmodel {

class JsonModel;

/**
 * @brief Descriptor binding one model field to a JSON key
 *
 * A descriptor is declared once per model type and shared by every instance
 * of that type. It never changes after construction. Values live in the
 * instance's storage under internal_key(); the JSON side uses external_key().
 */
class Field {
public:
    enum class Kind { SCALAR, MODEL, MODEL_LIST };

    Field(std::string external_key, std::string internal_key, Kind kind);
    virtual ~Field() = default;

    Field(const Field&) = delete;
    Field& operator=(const Field&) = delete;

    const std::string& external_key() const { return external_key_; }
    const std::string& internal_key() const { return internal_key_; }
    Kind kind() const { return kind_; }
    static const char* kind_name(Kind kind);

    // Name of the nested model type, empty for scalar fields
    virtual std::string nested_model_name() const { return {}; }

    // Stored value, or a shared JSON null when the field was never set
    const FieldValue& get(const JsonModel& instance) const;
    void set(JsonModel& instance, FieldValue value) const;
    bool is_set(const JsonModel& instance) const;

    FieldValue* find(JsonModel& instance) const;
    const FieldValue* find(const JsonModel& instance) const;

    virtual nlohmann::json to_external(const FieldValue& value) const = 0;
    virtual FieldValue from_external(const nlohmann::json& value) const = 0;

protected:
    // Direct population used by from_json_entity, bypasses set()
    void store(JsonModel& instance, FieldValue value) const;

    std::string describe() const;

private:
    friend class JsonModel;

    std::string external_key_;
    std::string internal_key_;
    Kind kind_;
};

// Plain JSON value, passed through unchanged in both directions
class ScalarField final : public Field {
public:
    ScalarField(std::string external_key, std::string internal_key);

    nlohmann::json to_external(const FieldValue& value) const override;
    FieldValue from_external(const nlohmann::json& value) const override;
};

}  // namespace jsonmodel
