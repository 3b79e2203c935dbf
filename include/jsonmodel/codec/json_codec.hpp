#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "jsonmodel/codec/codec_config.hpp"
#include "jsonmodel/model/json_model.hpp"

namespace jsonmodel::codec {

// Text-level failure: malformed JSON, or output that cannot be encoded
class CodecException : public std::runtime_error {
public:
    explicit CodecException(const std::string& message)
        : std::runtime_error("Codec error: " + message) {}
};

/**
 * @brief Bridge between models and JSON text
 *
 * Text handling is delegated to nlohmann::json; models only ever see parsed
 * values. Model-level errors (InvalidInputType and friends) propagate
 * unchanged, text-level errors are reported as CodecException.
 */
class JsonCodec {
public:
    JsonCodec() = default;
    explicit JsonCodec(CodecConfig config);

    const CodecConfig& config() const { return config_; }

    nlohmann::json parse(const std::string& text) const;
    std::string dump(const nlohmann::json& value) const;

    std::string encode(const JsonModel& model) const;

    template <typename M>
    M decode(const std::string& text) const {
        return M::from_json_entity(parse(text));
    }

    // Decode into the model registered under model_name
    std::unique_ptr<JsonModel> decode(const std::string& model_name,
                                      const std::string& text) const;

private:
    CodecConfig config_;
};

}  // namespace jsonmodel::codec
