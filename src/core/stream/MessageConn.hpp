#pragma once

/**
 * MessageConn.hpp
 *
 * Message-oriented bidirectional transport carried by stream operations.
 */

#include <memory>
#include <string>

namespace stevedore::core::stream {

enum class MessageType {
    Data,       // Opaque payload
    Barrier,    // No more data for now, the transport stays usable
    Close       // Transport terminated
};

struct Message {
    MessageType type{MessageType::Data};
    std::string payload;

    static Message data(std::string payload) {
        return Message{MessageType::Data, std::move(payload)};
    }

    static Message barrier() {
        return Message{MessageType::Barrier, {}};
    }

    static Message close() {
        return Message{MessageType::Close, {}};
    }
};

/**
 * MessageConn - abstract message transport
 *
 * One reader and one writer may use a connection concurrently.
 * close() unblocks a pending readMessage(), which then returns Close.
 */
class MessageConn {
public:
    virtual ~MessageConn() = default;

    /**
     * Read the next message, blocking
     * @return Message; Close once the transport is terminated
     * @throws TransportError on I/O failure
     * @throws ProtocolError on a malformed message
     */
    virtual Message readMessage() = 0;

    /**
     * Send a message. Writing Close terminates the transport.
     * @throws TransportError on I/O failure
     */
    virtual void writeMessage(const Message& message) = 0;

    /**
     * Terminate the transport. Closing twice has no effect.
     */
    virtual void close() = 0;
};

using MessageConnPtr = std::shared_ptr<MessageConn>;

} // namespace stevedore::core::stream
