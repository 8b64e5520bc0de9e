// TestSupport.hpp
// In-memory transports and byte streams shared by the test suites

#pragma once

#include "core/Channel.hpp"
#include "core/Errors.hpp"
#include "core/stream/ByteStream.hpp"
#include "core/stream/MessageConn.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace stevedore::testing {

using core::stream::Message;
using core::stream::MessageConn;
using core::stream::MessageType;

/**
 * One end of an in-memory message pipe. Closing an end terminates both
 * directions, the peer first drains what was already sent.
 */
class MemoryConn : public MessageConn {
public:
    MemoryConn()
        : m_inbox(std::make_shared<core::Channel<Message>>(0)) {}

    static std::pair<std::shared_ptr<MemoryConn>, std::shared_ptr<MemoryConn>> pair() {
        auto a = std::make_shared<MemoryConn>();
        auto b = std::make_shared<MemoryConn>();
        a->m_outbox = b->m_inbox;
        b->m_outbox = a->m_inbox;
        return {a, b};
    }

    Message readMessage() override {
        auto message = m_inbox->receive();
        if (!message) {
            return Message::close();
        }
        return std::move(*message);
    }

    void writeMessage(const Message& message) override {
        if (message.type == MessageType::Close) {
            close();
            return;
        }

        try {
            m_outbox->send(message);
        } catch (const core::ChannelClosed&) {
            throw core::TransportError("connection closed");
        }
    }

    void close() override {
        ++m_closeCalls;
        m_inbox->close();
        m_outbox->close();
    }

    int closeCalls() const { return m_closeCalls; }

private:
    std::shared_ptr<core::Channel<Message>> m_inbox;
    std::shared_ptr<core::Channel<Message>> m_outbox;
    std::atomic<int> m_closeCalls{0};
};

/**
 * Yields the given chunks one read at a time, then end of stream
 */
class ChunkReader : public core::stream::Reader {
public:
    explicit ChunkReader(std::vector<std::string> chunks)
        : m_chunks(std::move(chunks)) {}

    size_t read(char* buffer, size_t size) override {
        if (m_next >= m_chunks.size()) {
            return 0;
        }

        std::string& chunk = m_chunks[m_next];
        size_t n = std::min(size, chunk.size());
        std::memcpy(buffer, chunk.data(), n);

        chunk.erase(0, n);
        if (chunk.empty()) {
            ++m_next;
        }
        return n;
    }

private:
    std::vector<std::string> m_chunks;
    size_t m_next{0};
};

/**
 * Collects everything written; accepts at most limit bytes in total
 */
class StringWriter : public core::stream::Writer {
public:
    explicit StringWriter(size_t limit = std::string::npos)
        : m_limit(limit) {}

    size_t write(const char* data, size_t size) override {
        std::lock_guard<std::mutex> lock(m_mutex);

        size_t room = m_limit == std::string::npos ? size : m_limit - std::min(m_limit, m_data.size());
        size_t n = std::min(size, room);
        m_data.append(data, n);
        return n;
    }

    void close() override {
        ++m_closeCalls;
    }

    std::string data() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data;
    }

    int closeCalls() const { return m_closeCalls; }

private:
    size_t m_limit;
    mutable std::mutex m_mutex;
    std::string m_data;
    std::atomic<int> m_closeCalls{0};
};

} // namespace stevedore::testing
