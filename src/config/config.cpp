#include "jsonmodel/config/config.hpp"

#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "jsonmodel/log/logger.hpp"

namespace jsonmodel::config {

ConfigFormat format_from_path(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (extension == ".json") return ConfigFormat::JSON;
    if (extension == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

// Helper to convert YAML::Node to boost::property_tree::ptree
boost::property_tree::ptree ConfigManager::yaml_to_ptree(const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(), yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.push_back({"", yaml_to_ptree(*it)});  // Empty key for array elements
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    JSONMODEL_LOG_INFO << "Loading config file: " << config_file;

    try {
        boost::property_tree::ptree tree;
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                tree = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                if (!ifs) {
                    throw std::runtime_error("cannot open file");
                }
                boost::property_tree::read_json(ifs, tree);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                if (!ifs) {
                    throw std::runtime_error("cannot open file");
                }
                boost::property_tree::read_ini(ifs, tree);
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_tree_ = std::move(tree);
        }
        load_properties();
        JSONMODEL_LOG_INFO << "Successfully loaded config file: " << config_file;
    } catch (const std::exception& e) {
        JSONMODEL_LOG_ERROR << "Failed to load config file: " << config_file
                            << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_properties() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& [type_id, config] : configs_) {
        const std::string name = config->properties_name();
        auto subtree = config_tree_.get_child_optional(name);
        if (!subtree) {
            JSONMODEL_LOG_DEBUG << "No configuration found for " << name
                                << ", using defaults";
            continue;
        }
        try {
            config->from_ptree(*subtree);
            config->validate();
            JSONMODEL_LOG_DEBUG << "Loaded configuration for: " << name;
        } catch (const std::exception& e) {
            JSONMODEL_LOG_ERROR << "Failed to load configuration for " << name
                                << ": " << e.what();
            throw;
        }
    }
}

}  // namespace jsonmodel::config
