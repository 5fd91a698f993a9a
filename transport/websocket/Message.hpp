/**
 * \file Message.hpp
 * \brief Transport-level message variants carried across the relay queues.
 * \ingroup websocket_backend
 * \details The relay only produces `TextMessage`. The other variants exist so the
 * connection layer can describe everything a WebSocket peer may send; the output side
 * drops them. Messages are moved from producer to queue to consumer and never mutated.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace transport { namespace ws {

/** \brief UTF-8 text frame payload. */
struct TextMessage { std::string payload; };
/** \brief Binary frame payload (arbitrary bytes). */
struct BinaryMessage { std::string payload; };
/** \brief Ping control frame (payload limited to 125 bytes on the wire). */
struct PingMessage { std::string payload; };
/** \brief Pong control frame. */
struct PongMessage { std::string payload; };
/** \brief Close control frame. */
struct CloseMessage {
    std::uint16_t code = 1000; ///< RFC 6455 status code (1000 = normal closure)
    std::string reason;
};

using Message = std::variant<TextMessage, BinaryMessage, PingMessage, PongMessage, CloseMessage>;

inline Message make_text(std::string payload) { return TextMessage{std::move(payload)}; }

/** \brief Pointer to the text payload, or nullptr for any other variant. */
inline const std::string* text_payload(const Message& message) {
    if (auto text = std::get_if<TextMessage>(&message)) return &text->payload;
    return nullptr;
}

inline std::string_view kind_name(const Message& message) {
    switch (message.index()) {
        case 0: return "text";
        case 1: return "binary";
        case 2: return "ping";
        case 3: return "pong";
        case 4: return "close";
        default: return "unknown";
    }
}

} } // namespace transport::ws
