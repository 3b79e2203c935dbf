#pragma once

#include <boost/preprocessor/cat.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "jsonmodel/model/json_model.hpp"

namespace jsonmodel {

// Process-wide registry of model types by name, for callers that only know
// the model to build at run time
class ModelRegistry {
public:
    using Factory =
        std::function<std::unique_ptr<JsonModel>(const nlohmann::json& entity)>;

    static ModelRegistry& instance() {
        static ModelRegistry registry;
        return registry;
    }

    // Register M under name, or under M's model name when name is empty
    template <typename M>
    void register_model(const std::string& name = "") {
        register_factory(
            name.empty() ? M::declared_fields().model_name() : name,
            [](const nlohmann::json& entity) -> std::unique_ptr<JsonModel> {
                return std::make_unique<M>(M::from_json_entity(entity));
            });
    }

    void register_factory(const std::string& name, Factory factory);

    bool has_model(const std::string& name) const;
    std::vector<std::string> model_names() const;

    // Throws ModelException when no model is registered under name
    std::unique_ptr<JsonModel> from_json_entity(const std::string& name,
                                                const nlohmann::json& entity) const;

    void reset();

private:
    ModelRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;
};

// Registers a model type at static initialization
#define JSONMODEL_REGISTER_MODEL(ModelType)                                  \
    namespace {                                                              \
    [[maybe_unused]] static auto BOOST_PP_CAT(jsonmodel_registration_,      \
                                              __LINE__) = []() {            \
        ::jsonmodel::ModelRegistry::instance().register_model<ModelType>(); \
        return 0;                                                            \
    }();                                                                     \
    }

}  // namespace jsonmodel
