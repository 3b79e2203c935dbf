#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "jsonmodel/config/config.hpp"

namespace jsonmodel::codec {

// Text codec settings, loaded from the "codec" section
class CodecConfig : public config::ConfigurationProperties {
public:
    // Spaces per nesting level, -1 for compact single-line output
    int indent = -1;
    char indent_char = ' ';
    bool ensure_ascii = false;
    // How to dump strings holding invalid UTF-8: strict, replace or ignore
    std::string invalid_utf8 = "strict";
    bool ignore_comments = false;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "codec"; }

    nlohmann::json::error_handler_t error_handler() const;
};

}  // namespace jsonmodel::codec
