#pragma once

#include <string>

namespace CLI {
class App;
}

namespace mcpline {

inline constexpr const char* kServerName = "mcpline";
inline constexpr const char* kServerVersion = "1.0.0";

/**
 * @brief Runtime configuration of the stdio server
 *
 * Filled from the command line or a TOML/INI file passed with --config.
 */
struct ServerConfig {
    std::string log_level = "info";
    std::string log_file;                  // empty: log to stderr
    std::string server_name = kServerName;
    std::string server_version = kServerVersion;
    std::string command_program = "kubectl";
    int command_timeout_ms = 30000;
    std::string kv_file;                   // empty: empty key-value store
    std::string initial_namespace = "default";
};

/**
 * @brief Bind all ServerConfig fields to CLI11 options
 *
 * Also enables --config for reading the same options from a file.
 *
 * @param app CLI11 application to extend
 * @param config Target populated when app parses
 */
void add_config_options(CLI::App& app, ServerConfig& config);

/**
 * @brief Install the default spdlog logger
 *
 * Logs go to stderr, or to config.log_file when set. stdout stays
 * reserved for protocol frames.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void configure_logging(const ServerConfig& config);

} // namespace mcpline
