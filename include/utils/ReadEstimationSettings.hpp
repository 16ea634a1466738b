#ifndef READ_ESTIMATION_SETTINGS_HPP
#define READ_ESTIMATION_SETTINGS_HPP

#include <map>
#include <string>

namespace nettrans {

/**
 * @brief Reads a settings file of "key value" lines into a settings map.
 *
 * Blank lines and everything after '#' are ignored. Keys are the names
 * understood by the components' configure() methods; unknown keys are kept
 * and simply not consulted.
 *
 * @param filename Path to the settings file.
 * @return Key to numeric value.
 * @throws DataFormatException if the file cannot be opened, a line does not hold
 *         exactly one key and one number, or a key repeats.
 */
std::map<std::string, double> readSettingsFile(const std::string& filename);

/**
 * @brief Overlays @p overrides on @p base (override wins).
 */
std::map<std::string, double> mergeSettings(std::map<std::string, double> base,
                                            const std::map<std::string, double>& overrides);

/**
 * @brief Looks up an integer-valued setting.
 *
 * @param source Reported as the exception source.
 * @return The value of @p key, or @p default_value when the key is absent.
 * @throws InvalidConfigException naming @p key if the value is not a whole number
 *         in [min_value, INT_MAX].
 */
int integerSetting(const std::map<std::string, double>& settings,
                   const std::string& key,
                   int default_value,
                   int min_value,
                   const std::string& source);

} // namespace nettrans

#endif // READ_ESTIMATION_SETTINGS_HPP
