#include "RunCommandTool.hpp"
#include "mcp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <sstream>

namespace mcpline {

namespace {

bool selects_namespace(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        if (token == "-n" || token == "--namespace" || token == "-A" || token == "--all-namespaces"
            || token.rfind("--namespace=", 0) == 0) {
            return true;
        }
    }
    return false;
}

std::string join(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += part;
    }
    return joined;
}

} // namespace

RunCommandTool::RunCommandTool(std::shared_ptr<const CommandRunner> runner, std::string program)
    : runner_(std::move(runner)), program_(std::move(program)) {
    if (!runner_) {
        throw std::invalid_argument("Command runner cannot be null");
    }
    if (program_.empty()) {
        throw std::invalid_argument("Program cannot be empty");
    }
}

ToolInfo RunCommandTool::get_info(const std::string& program) {
    return {
        "run_command",
        "Run a " + program + " command and return its output",
        {
            {"type", "object"},
            {"properties", {
                {"command", {
                    {"type", "string"},
                    {"description", "Arguments passed to " + program + " (e.g. 'get pods')"}
                }}
            }},
            {"required", json::array({"command"})}
        }
    };
}

std::vector<std::string> RunCommandTool::build_argv(const std::string& command, const SessionContext& context) const {
    std::vector<std::string> tokens;
    std::istringstream stream(command);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    // Accept "kubectl get pods" as well as "get pods"
    if (!tokens.empty() && tokens.front() == program_) {
        tokens.erase(tokens.begin());
    }

    std::vector<std::string> argv{program_};
    argv.insert(argv.end(), tokens.begin(), tokens.end());

    const bool is_kubectl = std::filesystem::path(program_).filename() == "kubectl";
    if (is_kubectl && !tokens.empty() && !context.current_namespace.empty() && !selects_namespace(tokens)) {
        argv.push_back("-n");
        argv.push_back(context.current_namespace);
    }
    return argv;
}

json RunCommandTool::execute(const json& args, const SessionContext& context) const {
    const json command = args.value("command", json());
    if (!command.is_string()) {
        throw ToolExecutionError("command must be a string");
    }

    std::vector<std::string> argv = build_argv(command.get<std::string>(), context);
    if (argv.size() < 2) {
        throw ToolExecutionError("command must not be empty");
    }

    const std::string command_line = join(argv);
    spdlog::info("RunCommandTool: {}", command_line);

    CommandResult result;
    try {
        result = runner_->run(argv);
    } catch (const std::exception& e) {
        spdlog::error("RunCommandTool error: {}", e.what());
        throw ToolExecutionError(e.what());
    }

    return {
        {"command", command_line},
        {"stdout", result.standard_output},
        {"stderr", result.standard_error},
        {"exit_status", result.exit_status}
    };
}

} // namespace mcpline
