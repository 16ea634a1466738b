#include "utils/ReadEstimationSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace nettrans {

    static const std::string LOG_SOURCE = "ReadEstimationSettings";

    std::map<std::string, double> readSettingsFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            Logger::getInstance().error(LOG_SOURCE, "Could not open settings file: " + filename);
            throw DataFormatException("readSettingsFile", "Could not open settings file: " + filename);
        }

        std::map<std::string, double> settings;
        std::string line;
        int line_number = 0;
        while (std::getline(file, line)) {
            ++line_number;
            const auto comment = line.find('#');
            if (comment != std::string::npos) {
                line.erase(comment);
            }

            std::istringstream iss(line);
            std::string key;
            if (!(iss >> key)) continue;

            const std::string where = filename + ":" + std::to_string(line_number);
            std::string value_token;
            if (!(iss >> value_token)) {
                throw DataFormatException("readSettingsFile", where + ": missing value for key '" + key + "'");
            }
            std::string extra;
            if (iss >> extra) {
                throw DataFormatException("readSettingsFile", where + ": unexpected token '" + extra +
                                                              "' after value of '" + key + "'");
            }

            double value = 0.0;
            try {
                size_t consumed = 0;
                value = std::stod(value_token, &consumed);
                if (consumed != value_token.size()) {
                    throw std::invalid_argument(value_token);
                }
            } catch (const std::exception&) {
                throw DataFormatException("readSettingsFile", where + ": value '" + value_token +
                                                              "' for key '" + key + "' is not a number");
            }
            if (!std::isfinite(value)) {
                throw DataFormatException("readSettingsFile", where + ": value for key '" + key + "' is not finite");
            }

            if (!settings.emplace(key, value).second) {
                throw DataFormatException("readSettingsFile", where + ": duplicate key '" + key + "'");
            }
        }

        Logger::getInstance().info(LOG_SOURCE, "Read " + std::to_string(settings.size()) +
                                               " settings from " + filename);
        return settings;
    }

    std::map<std::string, double> mergeSettings(std::map<std::string, double> base,
                                                const std::map<std::string, double>& overrides) {
        for (const auto& kv : overrides) {
            base[kv.first] = kv.second;
        }
        return base;
    }

    int integerSetting(const std::map<std::string, double>& settings,
                       const std::string& key,
                       int default_value,
                       int min_value,
                       const std::string& source) {
        const auto it = settings.find(key);
        if (it == settings.end()) {
            return default_value;
        }
        const double value = it->second;
        const double max_value = static_cast<double>(std::numeric_limits<int>::max());
        if (!std::isfinite(value) || value != std::floor(value) ||
            value < static_cast<double>(min_value) || value > max_value) {
            std::ostringstream oss;
            oss << key << " must be an integer in [" << min_value << ", "
                << std::numeric_limits<int>::max() << "], got " << value;
            THROW_INVALID_CONFIG(source, oss.str());
        }
        return static_cast<int>(value);
    }

} // namespace nettrans
