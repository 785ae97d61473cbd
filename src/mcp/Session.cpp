#include "Session.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpline {

Session::Session(std::unique_ptr<ITransport> transport,
                 std::shared_ptr<const ToolRegistry> registry,
                 ServerInfo info,
                 SessionContext context)
    : transport_(std::move(transport)),
      dispatcher_(std::move(registry), std::move(info)),
      context_(std::move(context)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("Session created for {} {}",
        dispatcher_.server_info().name, dispatcher_.server_info().version);
}

void Session::run() {
    spdlog::info("Session starting main loop");

    try {
        while (state_ != SessionState::CLOSED) {
            std::optional<std::string> line = transport_->read_line();

            if (!line) {
                spdlog::info("Input stream closed, ending session");
                transport_->close();
                transition(SessionState::CLOSED);
                break;
            }

            std::optional<std::string> reply = handle_line(*line);
            if (reply) {
                transport_->write_line(*reply);
            }

            // The acknowledgement is already flushed at this point
            if (state_ == SessionState::SHUTTING_DOWN) {
                complete_shutdown();
            }
        }
    } catch (const TransportError& e) {
        spdlog::error("Transport failure, ending session: {}", e.what());
        state_ = SessionState::CLOSED;
        throw;
    }

    spdlog::info("Session stopped");
}

std::optional<std::string> Session::handle_line(const std::string& line) {
    if (state_ == SessionState::SHUTTING_DOWN || state_ == SessionState::CLOSED) {
        spdlog::warn("Ignoring input after shutdown");
        return std::nullopt;
    }

    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        spdlog::debug("Skipping blank line");
        return std::nullopt;
    }

    spdlog::debug("Received: {}", line);

    DecodeResult decoded = MessageCodec::decode(line);
    if (const auto* failure = std::get_if<ParseFailure>(&decoded)) {
        spdlog::warn("Rejecting message ({}): {}", failure->error.message, failure->raw);
        return MessageCodec::encode(ErrorResponse{failure->id, failure->error});
    }

    std::optional<Message> reply = handle_message(std::get<Message>(decoded));
    if (!reply) {
        return std::nullopt;
    }
    return MessageCodec::encode(*reply);
}

std::optional<Message> Session::handle_message(const Message& message) {
    if (state_ == SessionState::SHUTTING_DOWN || state_ == SessionState::CLOSED) {
        return std::nullopt;
    }

    if (const auto* request = std::get_if<Request>(&message)) {
        return handle_request(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        handle_notification(*notification);
        return std::nullopt;
    }

    spdlog::debug("Ignoring response message from peer");
    return std::nullopt;
}

Message Session::handle_request(const Request& request) {
    const MethodSpec* spec = dispatcher_.find_method(request.method);

    // Before the handshake every request except initialize is a lifecycle
    // violation, including unknown ones.
    const bool forbidden = spec
        ? spec->allowed_states.count(state_) == 0
        : state_ == SessionState::UNINITIALIZED;
    if (forbidden) {
        LifecycleViolation violation(request.method, to_string(state_));
        spdlog::warn("{}", violation.what());
        return ErrorResponse{request.id, ErrorMapper::from_error(violation)};
    }

    Message reply = dispatcher_.dispatch(request, context_);

    if (spec && spec->on_success && std::holds_alternative<Response>(reply)) {
        transition(*spec->on_success);
    }
    return reply;
}

void Session::handle_notification(const Notification& notification) {
    if (state_ == SessionState::UNINITIALIZED) {
        spdlog::debug("Dropping notification {} received before initialize", notification.method);
        return;
    }

    if (dispatcher_.is_known_notification(notification.method)) {
        spdlog::info("Client sent {}", notification.method);
    } else {
        spdlog::debug("Ignoring unknown notification: {}", notification.method);
    }
}

void Session::complete_shutdown() {
    transport_->close();
    transition(SessionState::CLOSED);
}

void Session::transition(SessionState next) {
    spdlog::info("Session state {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

} // namespace mcpline
