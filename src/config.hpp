#ifndef LANDCALC_CONFIG_HPP
#define LANDCALC_CONFIG_HPP

#include "project.hpp"
#include <stdexcept>
#include <string>

namespace landcalc {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Locations of the CSV record files for one project
 *
 * Empty paths mean the project has no records of that kind.
 */
struct InputPaths {
    std::string budget;
    std::string parcels;
    std::string acquisitions;
    std::string loans;
    std::string divisions;
};

/**
 * @brief Project configuration: master record, DCF assumptions and inputs
 */
struct ProjectConfig {
    ProjectRecord project;
    DcfAssumptions dcf;
    InputPaths inputs;
};

/**
 * @brief Parses a project configuration from a JSON file
 *
 * Relative input paths are resolved against the directory containing the file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed project configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ValidationError if a date or analysis type is malformed
 */
ProjectConfig parse_project_config_from_file(const std::string& file_path);

/**
 * @brief Parses a project configuration from a JSON string
 *
 * Input paths are returned after environment expansion, unresolved.
 *
 * @param json_string JSON configuration as string
 * @return Parsed project configuration
 * @throws ConfigParseError if JSON is invalid or project_id is missing
 * @throws ValidationError if a date or analysis type is malformed
 */
ProjectConfig parse_project_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute and empty paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace landcalc

#endif // LANDCALC_CONFIG_HPP
