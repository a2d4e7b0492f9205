/**
 * @file logger.hpp
 * @brief Structured logging for projection runs
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Projection context (project id, container filter, stage)
 * - Timing per pipeline stage and per run
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef LANDCALC_LOGGER_HPP
#define LANDCALC_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace landcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-loan schedules, intermediate stage results
    INFO,    ///< Projection start/end, stage completion
    WARN,    ///< Non-fatal issues (non-converged reserve, dropped records)
    ERROR    ///< Failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (unknown values fall back to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies the projection run an event belongs to
 */
struct ProjectionContext {
    int64_t project_id;
    std::string containers;     ///< Comma-separated container filter, empty for whole project
    std::string stage;          ///< Current pipeline stage (periods, costs, absorption, ...)

    ProjectionContext() : project_id(0) {}
    explicit ProjectionContext(int64_t id) : project_id(id) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("landcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   ProjectionContext ctx(42);
 *   Logger::get_instance().log_projection_start(ctx, true);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration; opens (or closes) the file sink
     */
    void configure(const LoggerConfig& config);

    void log_projection_start(const ProjectionContext& ctx, bool include_financing);

    /**
     * @brief Log completion of one pipeline stage
     *
     * @param ctx Projection context (stage is taken from ctx.stage)
     * @param records Number of records the stage produced
     * @param elapsed_ms Stage wall time
     */
    void log_stage_complete(const ProjectionContext& ctx, size_t records, double elapsed_ms);

    /**
     * @brief Log a solved loan schedule
     */
    void log_loan_schedule(
        const ProjectionContext& ctx,
        int64_t loan_id,
        const std::string& structure,
        int iterations,
        bool converged,
        double peak_balance
    );

    void log_projection_complete(
        const ProjectionContext& ctx,
        size_t periods,
        size_t sections,
        double elapsed_ms
    );

    void log_warning(const ProjectionContext& ctx, const std::string& warning_message);

    void log_error(const ProjectionContext& ctx, const std::string& error_message);

    /**
     * @brief Free-form message, used by the CLI outside a projection
     */
    void log_message(LogLevel level, const std::string& message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const ProjectionContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace landcalc

#endif // LANDCALC_LOGGER_HPP
