#pragma once

#include <optional>
#include <string>

namespace mcpline {

/**
 * @brief Abstract interface for line-oriented MCP transports
 *
 * A transport moves newline-terminated text frames over a duplex stream.
 * It knows nothing about JSON or the protocol; decoding happens in
 * MessageCodec.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next line from the transport
     * @return Line without its terminator, or std::nullopt once the stream is closed
     * @throws TransportError if the underlying stream fails
     */
    virtual std::optional<std::string> read_line() = 0;

    /**
     * @brief Write one line and flush it to the peer immediately
     * @param line Frame without terminator (must not contain '\n')
     * @throws TransportError if the transport is closed or the write fails
     */
    virtual void write_line(const std::string& line) = 0;

    /**
     * @brief Close the transport; further reads report end of stream
     */
    virtual void close() = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace mcpline
