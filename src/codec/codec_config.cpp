#include "jsonmodel/codec/codec_config.hpp"

#include <stdexcept>

namespace jsonmodel::codec {

void CodecConfig::from_ptree(const boost::property_tree::ptree& pt) {
    indent = get_value(pt, "indent", indent);
    if (auto indent_str = get_optional_value<std::string>(pt, "indent_char")) {
        if (indent_str->size() != 1) {
            throw std::invalid_argument(
                "Codec indent_char must be a single character");
        }
        indent_char = indent_str->front();
    }
    ensure_ascii = get_value(pt, "ensure_ascii", ensure_ascii);
    invalid_utf8 = get_value(pt, "invalid_utf8", invalid_utf8);
    ignore_comments = get_value(pt, "ignore_comments", ignore_comments);
}

void CodecConfig::validate() const {
    if (indent < -1) {
        throw std::invalid_argument("Codec indent must be -1 or greater");
    }
    if (invalid_utf8 != "strict" && invalid_utf8 != "replace" &&
        invalid_utf8 != "ignore") {
        throw std::invalid_argument(
            "Codec invalid_utf8 must be 'strict', 'replace' or 'ignore'");
    }
}

nlohmann::json::error_handler_t CodecConfig::error_handler() const {
    if (invalid_utf8 == "replace") return nlohmann::json::error_handler_t::replace;
    if (invalid_utf8 == "ignore") return nlohmann::json::error_handler_t::ignore;
    return nlohmann::json::error_handler_t::strict;
}

}  // namespace jsonmodel::codec
