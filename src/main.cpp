#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "in_memory_provider.hpp"
#include "logger.hpp"
#include "projection_engine.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/record_loader.hpp"

using namespace landcalc;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string containers;             // Comma-separated container ids
    bool include_financing = false;
    std::string output_path;            // Empty means stdout
    std::string parquet_output_path;
    std::string log_level = "INFO";
    std::string log_file;
    std::string log_format = "json";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "landcalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <project.json> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON project configuration (required)\n";
    std::cerr << "  --containers <ids>          Comma-separated container ids to project\n";
    std::cerr << "  --include-financing         Add debt service and extend the horizon for loans\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet-output <path>     Parquet file with line-item cash flows\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also write log lines to a file\n";
    std::cerr << "  --log-format <format>       json or text (default: json)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config data/project.json \\\n";
    std::cerr << "      --containers 1,2 --include-financing \\\n";
    std::cerr << "      --output projection.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--containers" && i + 1 < argc) {
            args.containers = argv[++i];
        } else if (arg == "--include-financing") {
            args.include_financing = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet-output" && i + 1 < argc) {
            args.parquet_output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-format" && i + 1 < argc) {
            args.log_format = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// "1,2,5" -> {1, 2, 5}; returns false on a malformed id
bool parse_container_ids(const std::string& text, std::vector<int64_t>& ids) {
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (token.empty()) {
            continue;
        }
        try {
            size_t used = 0;
            long long id = std::stoll(token, &used);
            if (used != token.size()) {
                return false;
            }
            ids.push_back(static_cast<int64_t>(id));
        } catch (const std::logic_error&) {
            return false;
        }
    }
    return !ids.empty();
}

bool validate_args(const CLIArgs& args, ContainerFilter& containers) {
    bool valid = true;

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.containers.empty()) {
        std::vector<int64_t> ids;
        if (parse_container_ids(args.containers, ids)) {
            containers = std::move(ids);
        } else {
            std::cerr << "Error: --containers must be a comma-separated list of integer ids\n";
            valid = false;
        }
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be one of DEBUG, INFO, WARN, ERROR\n";
        valid = false;
    }

    if (args.log_format != "json" && args.log_format != "text") {
        std::cerr << "Error: --log-format must be json or text\n";
        valid = false;
    }

    return valid;
}

void configure_logging(const CLIArgs& args) {
    LoggerConfig config;
    config.min_level = string_to_level(args.log_level);
    config.enable_json = args.log_format == "json";
    if (!args.log_file.empty()) {
        config.enable_file = true;
        config.log_file_path = args.log_file;
    }
    Logger::get_instance().configure(config);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    ContainerFilter containers;
    if (!validate_args(args, containers)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    configure_logging(args);
    Logger& logger = Logger::get_instance();

    try {
        ProjectConfig config = parse_project_config_from_file(args.config_path);
        logger.log_message(LogLevel::INFO, "Loaded configuration for project " +
                                           std::to_string(config.project.project_id) +
                                           " from " + args.config_path);

        InMemoryDataProvider provider(load_project_inputs(config));
        ProjectionEngine engine(provider);
        Projection projection = engine.project(config.project.project_id, containers,
                                               args.include_financing);

        if (args.output_path.empty()) {
            io::write_projection_json(std::cout, projection);
        } else {
            io::write_projection_json(args.output_path, projection);
            logger.log_message(LogLevel::INFO, "Projection written to " + args.output_path);
        }

        if (!args.parquet_output_path.empty()) {
            ParquetWriter::write_cash_flows(projection, args.parquet_output_path);
            logger.log_message(LogLevel::INFO, "Cash flows written to " + args.parquet_output_path);
        }
    } catch (const std::exception& e) {
        logger.log_message(LogLevel::ERROR, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    logger.flush();
    return 0;
}
