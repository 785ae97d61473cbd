#include "MathTool.hpp"
#include "mcp/Errors.hpp"
#include <cmath>
#include <cstdint>
#include <functional>

namespace mcpline {

namespace {

// 2^53: larger magnitudes are not exact in a double
constexpr double kMaxExactInteger = 9007199254740992.0;

struct OperationSpec {
    MathTool::Operation operation;
    const char* name;
    const char* description;
    std::vector<const char*> operands;
};

const std::vector<OperationSpec>& operation_specs() {
    static const std::vector<OperationSpec> specs = {
        {MathTool::Operation::ADD, "add", "Add two numbers", {"a", "b"}},
        {MathTool::Operation::SUBTRACT, "subtract", "Subtract second number from first number", {"a", "b"}},
        {MathTool::Operation::MULTIPLY, "multiply", "Multiply two numbers", {"a", "b"}},
        {MathTool::Operation::DIVIDE, "divide", "Divide first number by second number", {"a", "b"}},
        {MathTool::Operation::POWER, "power", "Raise first number to the power of second number", {"base", "exponent"}},
        {MathTool::Operation::SQUARE_ROOT, "square_root", "Calculate square root of a number", {"x"}}
    };
    return specs;
}

const OperationSpec& spec_for(MathTool::Operation operation) {
    for (const auto& spec : operation_specs()) {
        if (spec.operation == operation) {
            return spec;
        }
    }
    throw std::invalid_argument("Unknown math operation");
}

const json& operand(const json& args, const char* name) {
    if (!args.contains(name) || !args[name].is_number()) {
        throw ToolExecutionError(std::string("Parameter '") + name + "' must be a number");
    }
    return args[name];
}

json checked(double value) {
    if (!std::isfinite(value)) {
        throw ToolExecutionError("Result is not a finite number");
    }
    return value;
}

json binary(const json& lhs, const json& rhs,
            const std::function<std::int64_t(std::int64_t, std::int64_t)>& integral,
            const std::function<double(double, double)>& real) {
    const double value = real(lhs.get<double>(), rhs.get<double>());
    if (lhs.is_number_integer() && rhs.is_number_integer() && std::fabs(value) <= kMaxExactInteger) {
        return integral(lhs.get<std::int64_t>(), rhs.get<std::int64_t>());
    }
    return checked(value);
}

} // namespace

MathTool::MathTool(Operation operation)
    : operation_(operation) {}

std::vector<MathTool::Operation> MathTool::all_operations() {
    std::vector<Operation> operations;
    for (const auto& spec : operation_specs()) {
        operations.push_back(spec.operation);
    }
    return operations;
}

ToolInfo MathTool::get_info(Operation operation) {
    const OperationSpec& spec = spec_for(operation);

    json properties = json::object();
    json required = json::array();
    for (const char* name : spec.operands) {
        properties[name] = {{"type", "number"}};
        required.push_back(name);
    }

    return {
        spec.name,
        spec.description,
        {
            {"type", "object"},
            {"properties", properties},
            {"required", required}
        }
    };
}

json MathTool::execute(const json& args) const {
    switch (operation_) {
        case Operation::ADD:
            return binary(operand(args, "a"), operand(args, "b"),
                [](std::int64_t a, std::int64_t b) { return a + b; },
                [](double a, double b) { return a + b; });

        case Operation::SUBTRACT:
            return binary(operand(args, "a"), operand(args, "b"),
                [](std::int64_t a, std::int64_t b) { return a - b; },
                [](double a, double b) { return a - b; });

        case Operation::MULTIPLY:
            return binary(operand(args, "a"), operand(args, "b"),
                [](std::int64_t a, std::int64_t b) { return a * b; },
                [](double a, double b) { return a * b; });

        case Operation::DIVIDE: {
            const double divisor = operand(args, "b").get<double>();
            if (divisor == 0.0) {
                throw ToolExecutionError("Division by zero is not allowed");
            }
            return checked(operand(args, "a").get<double>() / divisor);
        }

        case Operation::POWER: {
            const json& base = operand(args, "base");
            const json& exponent = operand(args, "exponent");
            const double value = std::pow(base.get<double>(), exponent.get<double>());
            if (base.is_number_integer() && exponent.is_number_integer() && exponent.get<std::int64_t>() >= 0
                && std::fabs(value) <= kMaxExactInteger) {
                return static_cast<std::int64_t>(std::llround(value));
            }
            return checked(value);
        }

        case Operation::SQUARE_ROOT: {
            const double x = operand(args, "x").get<double>();
            if (x < 0.0) {
                throw ToolExecutionError("Cannot calculate square root of a negative number");
            }
            return checked(std::sqrt(x));
        }
    }
    throw ToolExecutionError("Unsupported operation");
}

} // namespace mcpline
