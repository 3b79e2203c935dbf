#pragma once

#include <stdexcept>
#include <string>

namespace jsonmodel {

// Root of all model-layer errors
class ModelException : public std::runtime_error {
public:
    explicit ModelException(const std::string& message)
        : std::runtime_error("Model error: " + message) {}
};

// from_json_entity was handed something other than a JSON object
class InvalidInputType : public ModelException {
public:
    explicit InvalidInputType(const std::string& message)
        : ModelException("invalid input type: " + message) {}
};

// A stored or external value does not have the shape its field expects
class ConversionTypeMismatch : public ModelException {
public:
    explicit ConversionTypeMismatch(const std::string& message)
        : ModelException("conversion type mismatch: " + message) {}
};

// Two declared fields collide on their internal or external key
class ModelDefinitionError : public ModelException {
public:
    explicit ModelDefinitionError(const std::string& message)
        : ModelException("invalid model definition: " + message) {}
};

// An initializer or generic setter names a field the model does not declare
class UnknownFieldError : public ModelException {
public:
    explicit UnknownFieldError(const std::string& message)
        : ModelException("unknown field: " + message) {}
};

}  // namespace jsonmodel
