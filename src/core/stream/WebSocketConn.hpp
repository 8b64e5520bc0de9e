#pragma once

/**
 * WebSocketConn.hpp
 *
 * MessageConn over a WebSocket (Boost.Beast).
 *
 * Frame mapping:
 * - Data    <-> binary frame
 * - Barrier <-> empty text frame
 * - Close   <-> close frame
 *
 * Each connection runs its own io_context thread. The blocking calls post
 * asynchronous operations to it and wait, so reads, writes, control frame
 * replies and the closing handshake never touch the stream concurrently.
 */

#include "MessageConn.hpp"
#include "../Logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace stevedore::core::stream {

class WebSocketConn : public MessageConn {
public:
    using tcp = boost::asio::ip::tcp;

    ~WebSocketConn() override;

    WebSocketConn(const WebSocketConn&) = delete;
    WebSocketConn& operator=(const WebSocketConn&) = delete;

    /**
     * Open a client connection
     * @param host Server host
     * @param port Server port
     * @param target Request target, e.g. "/1.0/operations/<id>/websocket?secret=<s>"
     * @throws TransportError if the connection or the handshake fails
     */
    static std::shared_ptr<WebSocketConn> connect(const std::string& host,
                                                  const std::string& port,
                                                  const std::string& target,
                                                  LoggerPtr logger = nullptr);

    /**
     * Accept the next connection on an acceptor and perform the server
     * side handshake
     * @throws TransportError if accepting or the handshake fails
     */
    static std::shared_ptr<WebSocketConn> accept(tcp::acceptor& acceptor, LoggerPtr logger = nullptr);

    Message readMessage() override;
    void writeMessage(const Message& message) override;

    /**
     * Run the closing handshake. Unblocks a pending readMessage().
     */
    void close() override;

    /**
     * Request target of the handshake (server side only)
     */
    const std::string& target() const { return m_target; }

private:
    explicit WebSocketConn(LoggerPtr logger);

    // Start the io thread once the handshake is done
    void run();

    // io thread only
    void startClose();

private:
    std::unique_ptr<boost::asio::io_context> m_ioc;
    boost::beast::websocket::stream<boost::beast::tcp_stream> m_ws;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_work;
    std::thread m_thread;

    LoggerPtr m_logger;
    std::string m_target;

    std::mutex m_readMutex;
    std::mutex m_writeMutex;
    std::atomic<bool> m_closed{false};

    // io thread state
    boost::beast::flat_buffer m_readBuffer;
    bool m_writing{false};
    bool m_closeAfterWrite{false};
    bool m_closing{false};
    std::promise<void>* m_closeDone{nullptr};
};

} // namespace stevedore::core::stream
