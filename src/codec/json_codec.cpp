#include "jsonmodel/codec/json_codec.hpp"

#include "jsonmodel/log/logger.hpp"
#include "jsonmodel/model/model_registry.hpp"

namespace jsonmodel::codec {

JsonCodec::JsonCodec(CodecConfig config) : config_(std::move(config)) {
    config_.validate();
}

nlohmann::json JsonCodec::parse(const std::string& text) const {
    try {
        return nlohmann::json::parse(text, nullptr, true,
                                     config_.ignore_comments);
    } catch (const nlohmann::json::exception& e) {
        JSONMODEL_LOG_DEBUG << "JSON parse failed: " << e.what();
        throw CodecException("JSON parsing failed: " + std::string(e.what()));
    }
}

std::string JsonCodec::dump(const nlohmann::json& value) const {
    try {
        return value.dump(config_.indent, config_.indent_char,
                          config_.ensure_ascii, config_.error_handler());
    } catch (const nlohmann::json::exception& e) {
        throw CodecException("JSON encoding failed: " + std::string(e.what()));
    }
}

std::string JsonCodec::encode(const JsonModel& model) const {
    return dump(model.to_json_entity());
}

std::unique_ptr<JsonModel> JsonCodec::decode(const std::string& model_name,
                                             const std::string& text) const {
    return ModelRegistry::instance().from_json_entity(model_name, parse(text));
}

}  // namespace jsonmodel::codec
