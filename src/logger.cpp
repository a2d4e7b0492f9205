/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace landcalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_(LoggerConfig()) {}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    flush();
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(const ProjectionContext& ctx) const {
    std::map<std::string, std::string> fields;
    fields["project_id"] = std::to_string(ctx.project_id);
    if (!ctx.containers.empty()) {
        fields["containers"] = ctx.containers;
    }
    if (!ctx.stage.empty()) {
        fields["stage"] = ctx.stage;
    }
    return fields;
}

void Logger::log_projection_start(const ProjectionContext& ctx, bool include_financing) {
    auto fields = context_fields(ctx);
    fields["event"] = "projection_start";
    fields["include_financing"] = include_financing ? "true" : "false";

    log(LogLevel::INFO, "Starting projection", fields);
}

void Logger::log_stage_complete(const ProjectionContext& ctx, size_t records, double elapsed_ms) {
    auto fields = context_fields(ctx);
    fields["event"] = "stage_complete";
    fields["records"] = std::to_string(records);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Stage complete", fields);
}

void Logger::log_loan_schedule(
    const ProjectionContext& ctx,
    int64_t loan_id,
    const std::string& structure,
    int iterations,
    bool converged,
    double peak_balance
) {
    auto fields = context_fields(ctx);
    fields["event"] = "loan_schedule";
    fields["loan_id"] = std::to_string(loan_id);
    fields["structure"] = structure;
    fields["iterations"] = std::to_string(iterations);
    fields["converged"] = converged ? "true" : "false";
    fields["peak_balance"] = std::to_string(peak_balance);

    log(LogLevel::DEBUG, "Loan schedule computed", fields);
}

void Logger::log_projection_complete(
    const ProjectionContext& ctx,
    size_t periods,
    size_t sections,
    double elapsed_ms
) {
    auto fields = context_fields(ctx);
    fields["event"] = "projection_complete";
    fields["periods"] = std::to_string(periods);
    fields["sections"] = std::to_string(sections);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Projection completed", fields);
}

void Logger::log_warning(const ProjectionContext& ctx, const std::string& warning_message) {
    auto fields = context_fields(ctx);
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const ProjectionContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx);
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Projection error", fields);
}

void Logger::log_message(LogLevel level, const std::string& message) {
    log(level, message, {});
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace landcalc
