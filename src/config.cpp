#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace landcalc {

namespace {

bool has_value(const json& j, const char* key) {
    return j.contains(key) && !j[key].is_null();
}

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    if (!has_value(j, key)) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

std::string path_field(const json& j, const char* key) {
    if (!has_value(j, key)) {
        return "";
    }
    return expand_environment_variables(j[key].get<std::string>());
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        // A lone '$' is left as is
        if (name_end == name_start) {
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

ProjectConfig parse_project_config_from_string(const std::string& json_string) {
    ProjectConfig config;

    try {
        json j = json::parse(json_string);

        // Parse project (required)
        if (!j.contains("project")) {
            throw ConfigParseError("Missing required field: project");
        }
        const json& project = j["project"];
        if (!has_value(project, "project_id")) {
            throw ConfigParseError("Project missing required field: project_id");
        }
        config.project.project_id = project["project_id"].get<int64_t>();
        if (has_value(project, "project_name")) {
            config.project.project_name = project["project_name"].get<std::string>();
        }
        if (has_value(project, "analysis_start_date")) {
            config.project.analysis_start_date =
                Date::parse_iso(project["analysis_start_date"].get<std::string>());
        }
        if (has_value(project, "analysis_type")) {
            config.project.analysis_type =
                parse_analysis_type(project["analysis_type"].get<std::string>());
        }
        if (has_value(project, "lotbank")) {
            const json& terms = project["lotbank"];
            LotbankTerms& lotbank = config.project.lotbank;
            lotbank.management_fee_pct = optional_field<double>(terms, "management_fee_pct").value_or(0.0);
            lotbank.default_provision_pct = optional_field<double>(terms, "default_provision_pct").value_or(0.0);
            lotbank.underwriting_fee = optional_field<double>(terms, "underwriting_fee").value_or(0.0);
        }

        // Parse dcf (optional)
        if (has_value(j, "dcf")) {
            const json& dcf = j["dcf"];
            config.dcf.hold_period_years = optional_field<int>(dcf, "hold_period_years");
            config.dcf.discount_rate = optional_field<double>(dcf, "discount_rate");
            config.dcf.price_growth_rate = optional_field<double>(dcf, "price_growth_rate");
            config.dcf.cost_inflation_rate = optional_field<double>(dcf, "cost_inflation_rate");
            config.dcf.selling_costs_pct = dcf.value("selling_costs_pct", 0.0);
        }

        // Parse inputs (optional)
        if (has_value(j, "inputs")) {
            const json& inputs = j["inputs"];
            config.inputs.budget = path_field(inputs, "budget");
            config.inputs.parcels = path_field(inputs, "parcels");
            config.inputs.acquisitions = path_field(inputs, "acquisitions");
            config.inputs.loans = path_field(inputs, "loans");
            config.inputs.divisions = path_field(inputs, "divisions");
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

ProjectConfig parse_project_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    ProjectConfig config = parse_project_config_from_string(buffer.str());

    InputPaths& inputs = config.inputs;
    inputs.budget = resolve_relative_path(inputs.budget, file_path);
    inputs.parcels = resolve_relative_path(inputs.parcels, file_path);
    inputs.acquisitions = resolve_relative_path(inputs.acquisitions, file_path);
    inputs.loans = resolve_relative_path(inputs.loans, file_path);
    inputs.divisions = resolve_relative_path(inputs.divisions, file_path);

    return config;
}

} // namespace landcalc
