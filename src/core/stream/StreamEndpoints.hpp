#pragma once

/**
 * StreamEndpoints.hpp
 *
 * One-time secrets guarding the stream channels of a websocket operation.
 */

#include "MessageConn.hpp"
#include "../Channel.hpp"
#include "../Logger.hpp"
#include "../operation/Metadata.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stevedore::core::stream {

/**
 * StreamEndpoints - issues a secret per channel and authorizes exactly one
 * connection per secret
 *
 * Channel names are "control" and the numbered streams "0", "1", "2".
 */
class StreamEndpoints {
public:
    /**
     * @param channels Channel names; every one must connect
     * @param logger Logger (may be null)
     */
    explicit StreamEndpoints(const std::vector<std::string>& channels, LoggerPtr logger = nullptr);

    /**
     * Channels of a command stream: control plus a single pty stream when
     * interactive, or separate stdin/stdout/stderr streams
     */
    static std::vector<std::string> commandChannels(bool interactive);

    StreamEndpoints(const StreamEndpoints&) = delete;
    StreamEndpoints& operator=(const StreamEndpoints&) = delete;

    /**
     * Attach a connection presenting a secret
     * @return Name of the channel it was attached to
     * @throws PermissionDeniedError if the secret is unknown
     * @throws OperationError if that channel is already connected
     */
    std::string connect(const std::string& secret, MessageConnPtr conn);

    /**
     * @return Connection of a channel, null if not connected yet
     */
    MessageConnPtr get(const std::string& channel) const;

    bool allConnected() const;

    /**
     * Fired once every channel is connected
     */
    std::shared_ptr<Signal> connectedSignal() const { return m_allConnected; }

    /**
     * Close every connected channel
     */
    void closeAll();

    operation::StreamSecretsMetadata metadata() const;

private:
    struct Endpoint {
        std::string secret;
        MessageConnPtr conn;
    };

    LoggerPtr m_logger;
    mutable std::mutex m_mutex;
    std::map<std::string, Endpoint> m_endpoints;
    size_t m_connected{0};
    std::shared_ptr<Signal> m_allConnected = std::make_shared<Signal>();
};

} // namespace stevedore::core::stream
