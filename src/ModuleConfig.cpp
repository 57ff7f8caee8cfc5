#include "ModuleConfig.hpp"
#include "AddressManager.hpp"
#include <fstream>
#include <iostream>

namespace auction {

    namespace {
        std::string trim(const std::string& text) {
            const size_t first = text.find_first_not_of(" \t\r");
            if (first == std::string::npos) return "";
            const size_t last = text.find_last_not_of(" \t\r");
            return text.substr(first, last - first + 1);
        }
    }

    bool ModuleConfig::isValid() const {
        return AddressManager::isValidAddress(hubAddress) &&
               AddressManager::isValidAddress(moduleAddress) &&
               AddressManager::isValidAddress(collectableTemplate) &&
               !dataDirectory.empty();
    }

    bool ModuleConfig::loadFromFile(const std::string& filename, ModuleConfig& config) {
        std::ifstream file(filename);
        if (!file) {
            std::cerr << "Error: Cannot open config file: " << filename << std::endl;
            return false;
        }

        ModuleConfig loaded = config;
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(file, line)) {
            ++lineNumber;
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            const size_t equals = line.find('=');
            if (equals == std::string::npos) {
                std::cerr << "Warning: Ignoring malformed config line " << lineNumber << std::endl;
                continue;
            }

            const std::string key = trim(line.substr(0, equals));
            const std::string value = trim(line.substr(equals + 1));

            try {
                if (key == "hub") {
                    loaded.hubAddress = AddressManager::normalizeAddress(value);
                } else if (key == "module") {
                    loaded.moduleAddress = AddressManager::normalizeAddress(value);
                } else if (key == "collectable_template") {
                    loaded.collectableTemplate = AddressManager::normalizeAddress(value);
                } else if (key == "data_dir") {
                    loaded.dataDirectory = value;
                } else {
                    std::cerr << "Warning: Unknown config key '" << key << "'" << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid value for '" << key << "' at line " << lineNumber
                          << ": " << e.what() << std::endl;
                return false;
            }
        }

        if (!loaded.isValid()) {
            std::cerr << "Error: Incomplete module configuration in " << filename << std::endl;
            return false;
        }

        config = loaded;
        return true;
    }

    bool ModuleConfig::saveToFile(const std::string& filename) const {
        std::ofstream file(filename);
        if (!file) {
            std::cerr << "Error: Cannot write config file: " << filename << std::endl;
            return false;
        }

        file << "# collect-auction module configuration\n";
        file << "hub=" << hubAddress << "\n";
        file << "module=" << moduleAddress << "\n";
        file << "collectable_template=" << collectableTemplate << "\n";
        file << "data_dir=" << dataDirectory << "\n";

        return file.good();
    }

} // namespace auction
