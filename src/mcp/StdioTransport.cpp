#include "StdioTransport.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcpline {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_line() {
    if (!open_) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            spdlog::debug("Reached end of input stream");
            return std::nullopt;
        }
        throw TransportError("Error reading from input stream");
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    spdlog::trace("Read line: {}", line);
    return line;
}

void StdioTransport::write_line(const std::string& line) {
    if (!open_) {
        throw TransportError("Write on closed transport");
    }
    if (line.find('\n') != std::string::npos) {
        throw std::invalid_argument("Frame must not contain a raw newline");
    }

    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw TransportError("Error writing to output stream");
    }
    spdlog::debug("Wrote message: {}", line);
}

void StdioTransport::close() {
    if (open_) {
        out_.flush();
        open_ = false;
        spdlog::debug("StdioTransport closed");
    }
}

bool StdioTransport::is_open() const {
    return open_ && out_.good();
}

} // namespace mcpline
