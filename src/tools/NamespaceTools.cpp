#include "NamespaceTools.hpp"
#include "mcp/Errors.hpp"
#include <spdlog/spdlog.h>

namespace mcpline {

ToolInfo GetNamespaceTool::get_info() {
    return {
        "get_namespace",
        "Get the namespace used by subsequent commands in this session",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json GetNamespaceTool::execute(const json&, const SessionContext& context) const {
    return {{"namespace", context.current_namespace}};
}

ToolInfo SetNamespaceTool::get_info() {
    return {
        "set_namespace",
        "Set the default namespace for subsequent commands",
        {
            {"type", "object"},
            {"properties", {
                {"namespace", {
                    {"type", "string"},
                    {"description", "The namespace to set as default"}
                }}
            }},
            {"required", json::array({"namespace"})}
        }
    };
}

json SetNamespaceTool::execute(const json& args, SessionContext& context) const {
    const json value = args.value("namespace", json());
    if (!value.is_string() || value.get<std::string>().empty()) {
        throw ToolExecutionError("namespace must be a non-empty string");
    }

    std::string previous = context.current_namespace;
    context.current_namespace = value.get<std::string>();
    spdlog::info("Namespace changed from '{}' to '{}'", previous, context.current_namespace);

    return {
        {"previous", previous},
        {"namespace", context.current_namespace},
        {"message", "Namespace changed from '" + previous + "' to '" + context.current_namespace + "'"}
    };
}

} // namespace mcpline
