#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "jsonmodel/codec/json_codec.hpp"
#include "jsonmodel/config/config.hpp"
#include "jsonmodel/jsonmodel.hpp"
#include "jsonmodel/log/logger.hpp"

namespace po = boost::program_options;

// Example models
class Address : public jsonmodel::Model<Address> {
public:
    JSONMODEL_PROPERTY(street, "Street")
    JSONMODEL_PROPERTY(city, "City")
    JSONMODEL_PROPERTY(postal_code, "PostalCode")
    JSONMODEL_FIELDS(Address, street, city, postal_code)
};

class Person : public jsonmodel::Model<Person> {
public:
    JSONMODEL_PROPERTY(name, "Name")
    JSONMODEL_PROPERTY(age, "Age")
    JSONMODEL_MODEL_PROPERTY(home, "Home", Address)
    JSONMODEL_MODEL_LIST_PROPERTY(friends, "Friends", Person)
    JSONMODEL_FIELDS(Person, name, age, home, friends)
};

JSONMODEL_REGISTER_MODEL(Address)
JSONMODEL_REGISTER_MODEL(Person)

namespace {

const char* SAMPLE_PERSON = R"({
    "Name": "Ada",
    "Age": 36,
    "Home": {"Street": "12 St James's Square", "City": "London"},
    "Friends": [{"Name": "Charles"}, {"Name": "Mary", "Age": null}],
    "Nickname": "Enchantress of Numbers"
})";

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

void print_person(const Person& person) {
    std::cout << "Name: " << person.name() << std::endl;
    std::cout << "Age: " << person.age() << std::endl;
    if (const Address* home = person.home()) {
        std::cout << "City: " << home->city() << std::endl;
    }
    std::cout << "Friends: " << person.friends().size() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("jsonmodel demo options");
    desc.add_options()("help,h", "Show help")(
        "config,c", po::value<std::string>(),
        "Configuration file (yaml, json or ini)")(
        "input,i", po::value<std::string>(),
        "JSON document to decode, a built-in sample when omitted")(
        "model,m", po::value<std::string>()->default_value("Person"),
        "Registered model to decode into")(
        "log-level,l", po::value<std::string>(), "Override the log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error parsing options: " << e.what() << "\n\n"
                  << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << "jsonmodel demo - decode and re-encode JSON documents\n\n"
                  << desc << std::endl;
        return 0;
    }

    try {
        auto& config_manager = jsonmodel::config::ConfigManager::instance();
        auto log_config = jsonmodel::config::ConfigurationPropertiesFactory<
            jsonmodel::log::LogConfig>::create_and_register();
        auto codec_config = jsonmodel::config::ConfigurationPropertiesFactory<
            jsonmodel::codec::CodecConfig>::create_and_register();

        std::string config_file = jsonmodel::config::ConfigPaths::DEFAULT_CONFIG_FILE;
        if (vm.count("config")) {
            config_file = vm["config"].as<std::string>();
        }
        if (vm.count("config") || std::filesystem::exists(config_file)) {
            config_manager.load_config(
                config_file, jsonmodel::config::format_from_path(config_file));
        }

        if (vm.count("log-level")) {
            log_config->global_level = jsonmodel::log::Logger::level_from_string(
                vm["log-level"].as<std::string>());
        }
        jsonmodel::log::Logger::init(*log_config);

        jsonmodel::codec::JsonCodec codec(*codec_config);
        const std::string text =
            vm.count("input") ? read_file(vm["input"].as<std::string>())
                              : std::string(SAMPLE_PERSON);
        const std::string model_name = vm["model"].as<std::string>();

        std::unique_ptr<jsonmodel::JsonModel> model = codec.decode(model_name, text);
        JSONMODEL_LOG_INFO << "Decoded " << model->model_name() << " with "
                           << model->set_field_count() << " field(s) set";

        if (auto* person = dynamic_cast<Person*>(model.get())) {
            print_person(*person);
        }

        std::cout << codec.encode(*model) << std::endl;
        jsonmodel::log::Logger::shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
