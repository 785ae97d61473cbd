#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace mcpline {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads frames line-by-line from the input stream and writes each frame
 * as one line followed by an explicit flush. The peer waits for every
 * reply before sending its next request, so nothing may stay buffered.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_line() override;
    void write_line(const std::string& line) override;
    void close() override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
    bool open_ = true;
};

} // namespace mcpline
