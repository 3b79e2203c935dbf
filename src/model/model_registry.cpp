#include "jsonmodel/model/model_registry.hpp"

#include <algorithm>

#include "jsonmodel/log/logger.hpp"
#include "jsonmodel/model/model_exception.hpp"

namespace jsonmodel {

void ModelRegistry::register_factory(const std::string& name, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (factories_.count(name)) {
        JSONMODEL_LOG_WARN << "Model '" << name
                           << "' registered again, replacing previous factory";
    }
    factories_[name] = std::move(factory);
    JSONMODEL_LOG_DEBUG << "Registered model: " << name;
}

bool ModelRegistry::has_model(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> ModelRegistry::model_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::unique_ptr<JsonModel> ModelRegistry::from_json_entity(
    const std::string& name, const nlohmann::json& entity) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            throw ModelException("no model registered under name '" + name + "'");
        }
        factory = it->second;
    }
    return factory(entity);
}

void ModelRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_.clear();
}

}  // namespace jsonmodel
