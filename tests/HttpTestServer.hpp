// HttpTestServer.hpp
// Minimal blocking HTTP/1.1 server on the loopback interface

#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stevedore::testing {

class HttpTestServer {
public:
    using tcp = boost::asio::ip::tcp;

    // Serves one request; target is the request path
    using Handler = std::function<void(tcp::socket& socket, const std::string& target)>;

    explicit HttpTestServer(Handler handler)
        : m_handler(std::move(handler))
        , m_acceptor(m_ioc, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
        m_thread = std::thread([this] { acceptLoop(); });
    }

    ~HttpTestServer() {
        m_stopping = true;

        // Wake the blocking accept
        boost::system::error_code ec;
        tcp::socket wake(m_ioc);
        wake.connect(m_acceptor.local_endpoint(), ec);

        m_thread.join();

        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& worker : m_workers) {
            worker.join();
        }
    }

    HttpTestServer(const HttpTestServer&) = delete;
    HttpTestServer& operator=(const HttpTestServer&) = delete;

    unsigned short port() const {
        return m_acceptor.local_endpoint().port();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port()) + path;
    }

    /**
     * Complete response with a body
     */
    static void respond(tcp::socket& socket, int status, const std::string& body) {
        std::string response = "HTTP/1.1 " + std::to_string(status) + " X\r\n"
                               "Content-Type: application/octet-stream\r\n"
                               "Content-Length: " + std::to_string(body.size()) + "\r\n"
                               "Connection: close\r\n\r\n" + body;

        boost::system::error_code ec;
        boost::asio::write(socket, boost::asio::buffer(response), ec);
    }

    /**
     * Announce a large body, then send one byte per interval until the
     * client goes away or the limit is reached
     */
    static void trickle(tcp::socket& socket, std::chrono::milliseconds interval,
                        std::chrono::seconds limit = std::chrono::seconds(20)) {
        std::string headers = "HTTP/1.1 200 OK\r\n"
                              "Content-Type: application/octet-stream\r\n"
                              "Content-Length: 1048576\r\n"
                              "Connection: close\r\n\r\n";

        boost::system::error_code ec;
        boost::asio::write(socket, boost::asio::buffer(headers), ec);

        auto deadline = std::chrono::steady_clock::now() + limit;
        while (!ec && std::chrono::steady_clock::now() < deadline) {
            boost::asio::write(socket, boost::asio::buffer("x", 1), ec);
            std::this_thread::sleep_for(interval);
        }
    }

private:
    void acceptLoop() {
        while (true) {
            tcp::socket socket(m_ioc);
            boost::system::error_code ec;
            m_acceptor.accept(socket, ec);

            if (ec || m_stopping) {
                return;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_workers.emplace_back([this, socket = std::move(socket)]() mutable {
                serve(socket);
            });
        }
    }

    void serve(tcp::socket& socket) {
        boost::asio::streambuf buffer;
        boost::system::error_code ec;
        boost::asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) {
            return;
        }

        std::string request(boost::asio::buffers_begin(buffer.data()),
                            boost::asio::buffers_end(buffer.data()));

        // "GET /path HTTP/1.1"
        auto first = request.find(' ');
        auto second = request.find(' ', first + 1);
        std::string target = request.substr(first + 1, second - first - 1);

        m_handler(socket, target);

        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

private:
    Handler m_handler;
    boost::asio::io_context m_ioc;
    tcp::acceptor m_acceptor;
    std::atomic<bool> m_stopping{false};

    std::thread m_thread;
    std::mutex m_mutex;
    std::vector<std::thread> m_workers;
};

} // namespace stevedore::testing
