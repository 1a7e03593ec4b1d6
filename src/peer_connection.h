#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace remotefm {

/**
 * Outbound half of the ordered message channel to the remote peer.
 * Framing and encoding of the JSON payload belong to the implementation.
 */
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    /**
     * Queue a message for the peer
     * @return false if the channel rejected the message
     */
    virtual bool send(const std::string& message_type, const nlohmann::json& payload) = 0;

    /**
     * Send a message and return only once the transport has accepted it.
     * Callers rely on this for per-transfer ordering with at most one
     * message in flight.
     */
    virtual bool send_blocking(const std::string& message_type, const nlohmann::json& payload) = 0;
};

// Typed helpers; Message must provide a TYPE constant and a to_json overload
template <typename Message>
bool send_message(PeerConnection& peer, const Message& message) {
    return peer.send(Message::TYPE, nlohmann::json(message));
}

template <typename Message>
bool send_message_blocking(PeerConnection& peer, const Message& message) {
    return peer.send_blocking(Message::TYPE, nlohmann::json(message));
}

} // namespace remotefm
