#include "ServerConfig.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpline {

namespace {

const char* const kLoggerName = "mcpline";

} // namespace

void add_config_options(CLI::App& app, ServerConfig& config) {
    app.set_config("--config", "", "Read options from a TOML or INI file");

    app.add_option("-l,--log-level", config.log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->capture_default_str();

    app.add_option("--log-file", config.log_file, "Write logs to this file instead of stderr");

    app.add_option("--server-name", config.server_name, "Server name reported by initialize")
        ->capture_default_str();

    app.add_option("--server-version", config.server_version, "Server version reported by initialize")
        ->capture_default_str();

    app.add_option("--command-program", config.command_program, "Program executed by the run_command tool")
        ->capture_default_str();

    app.add_option("--command-timeout-ms", config.command_timeout_ms, "Timeout for run_command in milliseconds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--kv-file", config.kv_file, "JSON object file backing the kv_lookup tool")
        ->check(CLI::ExistingFile);

    app.add_option("--namespace", config.initial_namespace, "Initial namespace of the session")
        ->capture_default_str();
}

void configure_logging(const ServerConfig& config) {
    spdlog::drop(kLoggerName);

    std::shared_ptr<spdlog::logger> logger;
    if (config.log_file.empty()) {
        logger = spdlog::stderr_color_mt(kLoggerName);
    } else {
        logger = spdlog::basic_logger_mt(kLoggerName, config.log_file);
        logger->flush_on(spdlog::level::warn);
    }

    logger->set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_default_logger(logger);
}

} // namespace mcpline
