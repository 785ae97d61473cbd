#pragma once

#include "Dispatcher.hpp"
#include "ITransport.hpp"
#include "Message.hpp"
#include "SessionState.hpp"
#include "ToolRegistry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mcpline {

/**
 * @brief One connected peer: lifecycle state machine plus the read/dispatch/write loop
 *
 * Processing is strictly sequential. A line is read, decoded, checked
 * against the current state, dispatched, and its reply written and
 * flushed before the next line is read.
 *
 * State transitions:
 *   UNINITIALIZED --initialize--> READY --shutdown--> SHUTTING_DOWN --> CLOSED
 * End of input moves any state to CLOSED.
 */
class Session {
public:
    /**
     * @brief Construct session over a transport
     * @param transport Unique pointer to transport implementation
     * @param registry Tool registry snapshot (immutable, may be shared)
     * @param info Server identity returned by initialize
     * @param context Initial session context
     */
    Session(std::unique_ptr<ITransport> transport,
            std::shared_ptr<const ToolRegistry> registry,
            ServerInfo info,
            SessionContext context = SessionContext());

    /**
     * @brief Run the session loop
     *
     * Returns once the session is CLOSED, either after shutdown or when
     * the peer closes the input stream.
     *
     * @throws TransportError if reading or writing fails; the session is CLOSED
     */
    void run();

    /**
     * @brief Process one raw line
     * @param line Line without terminator
     * @return Encoded reply, or std::nullopt when nothing must be sent
     */
    std::optional<std::string> handle_line(const std::string& line);

    /**
     * @brief Process one decoded message
     * @return Reply for requests, std::nullopt for everything else
     */
    std::optional<Message> handle_message(const Message& message);

    SessionState state() const { return state_; }

    const SessionContext& context() const { return context_; }

private:
    Message handle_request(const Request& request);
    void handle_notification(const Notification& notification);
    void complete_shutdown();
    void transition(SessionState next);

    std::unique_ptr<ITransport> transport_;
    Dispatcher dispatcher_;
    SessionContext context_;
    SessionState state_{SessionState::UNINITIALIZED};
};

} // namespace mcpline
