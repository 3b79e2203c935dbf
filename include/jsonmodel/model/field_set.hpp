#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

#include "jsonmodel/model/field.hpp"

namespace jsonmodel {

/**
 * @brief Ordered set of the field descriptors declared by one model type
 *
 * Built once per type from the parent type's set followed by the type's own
 * descriptors, so lookups cover the whole model hierarchy. A derived field
 * with the same internal key as an ancestor field takes its place.
 *
 * Throws ModelDefinitionError when a type declares the same internal or
 * external key twice, or when two fields of the final set share an external
 * key.
 */
class FieldSet {
public:
    using const_iterator = std::vector<const Field*>::const_iterator;

    explicit FieldSet(std::string model_name);
    FieldSet(std::string model_name, const FieldSet& parent,
             std::initializer_list<const Field*> own_fields);

    const std::string& model_name() const { return model_name_; }

    const Field* find_by_internal_key(const std::string& internal_key) const;
    const Field* find_by_external_key(const std::string& external_key) const;

    const std::vector<const Field*>& fields() const { return fields_; }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }
    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

private:
    void index();

    std::string model_name_;
    std::vector<const Field*> fields_;
    std::unordered_map<std::string, const Field*> by_internal_key_;
    std::unordered_map<std::string, const Field*> by_external_key_;
};

}  // namespace jsonmodel
