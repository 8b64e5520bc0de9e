/**
 * WebSocketConn.cpp
 *
 * Implementation of the WebSocket transport.
 */

#include "WebSocketConn.hpp"
#include "../Errors.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>

#include <chrono>

namespace stevedore::core::stream {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

using error_code = boost::system::error_code;

namespace {

/**
 * Completion of a read, computed on the io thread
 */
struct ReadResult {
    error_code ec;
    Message message;
};

} // namespace

WebSocketConn::WebSocketConn(LoggerPtr logger)
    : m_ioc(std::make_unique<asio::io_context>())
    , m_ws(*m_ioc)
    , m_logger(orNullLogger(std::move(logger))) {
}

WebSocketConn::~WebSocketConn() {
    m_work.reset();
    m_ioc->stop();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

std::shared_ptr<WebSocketConn> WebSocketConn::connect(const std::string& host,
                                                      const std::string& port,
                                                      const std::string& target,
                                                      LoggerPtr logger) {
    std::shared_ptr<WebSocketConn> conn(new WebSocketConn(std::move(logger)));

    try {
        tcp::resolver resolver(*conn->m_ioc);
        beast::get_lowest_layer(conn->m_ws).connect(resolver.resolve(host, port));

        conn->m_ws.handshake(host + ":" + port, target);

    } catch (const boost::system::system_error& e) {
        throw TransportError(e.what());
    }

    conn->m_logger->debug("WebSocket connected to {}:{}{}", host, port, target);
    conn->run();
    return conn;
}

std::shared_ptr<WebSocketConn> WebSocketConn::accept(tcp::acceptor& acceptor, LoggerPtr logger) {
    std::shared_ptr<WebSocketConn> conn(new WebSocketConn(std::move(logger)));

    try {
        acceptor.accept(beast::get_lowest_layer(conn->m_ws).socket());

        // Read the upgrade request ourselves to keep its target
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(beast::get_lowest_layer(conn->m_ws), buffer, request);

        conn->m_target = std::string(request.target());
        conn->m_ws.accept(request);

    } catch (const boost::system::system_error& e) {
        throw TransportError(e.what());
    }

    conn->m_logger->debug("WebSocket accepted for {}", conn->m_target);
    conn->run();
    return conn;
}

void WebSocketConn::run() {
    websocket::stream_base::timeout timeout;
    timeout.handshake_timeout = std::chrono::seconds(5);
    timeout.idle_timeout = websocket::stream_base::none();
    timeout.keep_alive_pings = false;
    m_ws.set_option(timeout);

    m_work.emplace(asio::make_work_guard(*m_ioc));
    m_thread = std::thread([this] { m_ioc->run(); });
}

Message WebSocketConn::readMessage() {
    std::lock_guard<std::mutex> lock(m_readMutex);

    std::promise<ReadResult> done;
    auto result = done.get_future();

    asio::post(*m_ioc, [this, &done] {
        m_ws.async_read(m_readBuffer, [this, &done](error_code ec, size_t) {
            ReadResult read{ec, Message::close()};

            if (!ec) {
                if (m_ws.got_text() && m_readBuffer.size() == 0) {
                    read.message = Message::barrier();
                } else {
                    read.message = Message::data(beast::buffers_to_string(m_readBuffer.data()));
                }
                m_readBuffer.consume(m_readBuffer.size());
            }

            done.set_value(std::move(read));
        });
    });

    ReadResult read = result.get();

    if (read.ec == websocket::error::closed) {
        return Message::close();
    }

    if (read.ec) {
        // Our own close() ended the read
        if (m_closed) {
            return Message::close();
        }
        throw TransportError(read.ec.message());
    }

    return std::move(read.message);
}

void WebSocketConn::writeMessage(const Message& message) {
    if (message.type == MessageType::Close) {
        close();
        return;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (m_closed) {
        throw TransportError("connection closed");
    }

    std::promise<error_code> done;
    auto result = done.get_future();

    asio::post(*m_ioc, [this, &message, &done] {
        if (m_closing) {
            done.set_value(asio::error::operation_aborted);
            return;
        }

        m_writing = true;

        asio::const_buffer payload;
        if (message.type == MessageType::Barrier) {
            m_ws.text(true);
        } else {
            m_ws.binary(true);
            payload = asio::buffer(message.payload);
        }

        m_ws.async_write(payload, [this, &done](error_code ec, size_t) {
            m_writing = false;
            done.set_value(ec);

            if (m_closeAfterWrite) {
                m_closeAfterWrite = false;
                startClose();
            }
        });
    });

    error_code ec = result.get();
    if (ec) {
        throw TransportError(ec.message());
    }
}

void WebSocketConn::close() {
    if (m_closed.exchange(true)) {
        return;
    }

    std::promise<void> done;
    auto result = done.get_future();

    asio::post(*m_ioc, [this, &done] {
        m_closeDone = &done;

        if (m_writing) {
            m_closeAfterWrite = true;
        } else {
            startClose();
        }
    });

    result.wait();
}

void WebSocketConn::startClose() {
    m_closing = true;

    m_ws.async_close(websocket::close_code::normal, [this](error_code ec) {
        if (ec) {
            m_logger->debug("WebSocket closing handshake incomplete: {}", ec.message());
        }

        error_code ignored;
        beast::get_lowest_layer(m_ws).socket().shutdown(tcp::socket::shutdown_both, ignored);

        m_closeDone->set_value();
        m_closeDone = nullptr;
    });
}

} // namespace stevedore::core::stream
