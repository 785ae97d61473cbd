#pragma once

#include "mcp/ToolRegistry.hpp"
#include <vector>

namespace mcpline {

/**
 * @brief Arithmetic tools (add, subtract, multiply, divide, power, square_root)
 *
 * Integer operands give an integer result where the exact value fits in
 * 53 bits; otherwise the result is a double. Invalid input or a
 * non-finite result raises ToolExecutionError.
 */
class MathTool {
public:
    enum class Operation {
        ADD,
        SUBTRACT,
        MULTIPLY,
        DIVIDE,
        POWER,
        SQUARE_ROOT
    };

    explicit MathTool(Operation operation);

    /**
     * @brief Get tool metadata and JSON schema for one operation
     */
    static ToolInfo get_info(Operation operation);

    static std::vector<Operation> all_operations();

    /**
     * @brief Execute the operation
     * @param args JSON object with numeric operands
     * @return Numeric result
     * @throws ToolExecutionError on non-numeric operands or invalid domain
     */
    json execute(const json& args) const;

private:
    Operation operation_;
};

} // namespace mcpline
