/**
 * StreamRelay.cpp
 *
 * Implementation of the stream pumps.
 */

#include "StreamRelay.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace stevedore::core::stream {

namespace {

/**
 * Shared state of a proxy: each transport is closed once, the completion
 * signal fires after the second loop exits
 */
struct ProxyState {
    MessageConnPtr a;
    MessageConnPtr b;
    std::once_flag aClosed;
    std::once_flag bClosed;
    std::atomic<int> running{2};
    SignalPtr done = std::make_shared<Signal>();
    LoggerPtr logger;

    void closeOnce(std::once_flag& flag, const MessageConnPtr& conn) {
        std::call_once(flag, [&] {
            try {
                conn->close();
            } catch (const std::exception& e) {
                logger->debug("Proxy close failed: {}", e.what());
            }
        });
    }

    void closeBoth() {
        closeOnce(aClosed, a);
        closeOnce(bClosed, b);
    }
};

void copyLoop(const std::shared_ptr<ProxyState>& state,
              const MessageConnPtr& from, const MessageConnPtr& to,
              const char* direction) {
    while (true) {
        Message message;

        try {
            message = from->readMessage();
        } catch (const std::exception& e) {
            state->logger->debug("Proxy {}: read failed: {}", direction, e.what());
            break;
        }

        if (message.type == MessageType::Close) {
            state->logger->debug("Proxy {}: connection closed", direction);
            break;
        }

        try {
            to->writeMessage(message);
        } catch (const std::exception& e) {
            state->logger->debug("Proxy {}: write failed: {}", direction, e.what());
            break;
        }
    }

    state->closeBoth();

    if (--state->running == 0) {
        state->done->fire();
    }
}

void drainInto(const LoggerPtr& logger, const MessageConnPtr& conn,
               const WriterPtr& sink, const SignalPtr& done) {
    while (true) {
        Message message;

        try {
            message = conn->readMessage();
        } catch (const std::exception& e) {
            logger->debug("Writer pump: read failed: {}", e.what());
            break;
        }

        if (message.type == MessageType::Close) {
            logger->debug("Writer pump: connection closed");
            break;
        }

        if (message.type == MessageType::Barrier) {
            logger->debug("Writer pump: got barrier");
            break;
        }

        size_t written = sink->write(message.payload.data(), message.payload.size());
        if (written != message.payload.size()) {
            logger->debug("Writer pump: short write ({} of {} bytes)",
                          written, message.payload.size());
            break;
        }
    }

    try {
        sink->close();
    } catch (const std::exception& e) {
        logger->debug("Writer pump: closing sink failed: {}", e.what());
    }

    done->fire();
}

} // namespace

StreamRelay::StreamRelay(LoggerPtr logger, size_t bufferSize)
    : m_logger(orNullLogger(std::move(logger)))
    , m_bufferSize(bufferSize > 0 ? bufferSize : DefaultBufferSize) {
}

ByteChannelPtr StreamRelay::readerToChannel(ReaderPtr source) const {
    auto channel = std::make_shared<ByteChannel>(1);

    std::thread([logger = m_logger, size = m_bufferSize, source = std::move(source), channel] {
        std::vector<char> buffer(size);

        try {
            while (true) {
                size_t n = source->read(buffer.data(), buffer.size());
                if (n == 0) {
                    break;
                }

                channel->send(std::string(buffer.data(), n));
            }
        } catch (const ChannelClosed&) {
            logger->debug("Reader pump: consumer went away");
        } catch (const std::exception& e) {
            logger->debug("Reader pump: read failed: {}", e.what());
        }

        channel->close();
    }).detach();

    return channel;
}

SignalPtr StreamRelay::defaultWriter(MessageConnPtr conn, WriterPtr sink) const {
    auto done = std::make_shared<Signal>();

    std::thread([logger = m_logger, conn = std::move(conn), sink = std::move(sink), done] {
        drainInto(logger, conn, sink, done);
    }).detach();

    return done;
}

SignalPtr StreamRelay::mirrorRead(MessageConnPtr conn, ReaderPtr source) const {
    auto done = std::make_shared<Signal>();
    auto channel = readerToChannel(std::move(source));

    std::thread([logger = m_logger, conn = std::move(conn), channel, done] {
        bool failed = false;

        while (auto chunk = channel->receive()) {
            try {
                conn->writeMessage(Message::data(std::move(*chunk)));
            } catch (const std::exception& e) {
                logger->debug("Mirror: write failed: {}", e.what());
                failed = true;
                break;
            }
        }

        // Releases a reader pump blocked on send
        channel->close();

        if (!failed) {
            try {
                conn->writeMessage(Message::barrier());
            } catch (const std::exception& e) {
                logger->debug("Mirror: sending barrier failed: {}", e.what());
            }
        }

        done->fire();
    }).detach();

    return done;
}

SignalPtr StreamRelay::mirrorWrite(MessageConnPtr conn, WriterPtr sink) const {
    return defaultWriter(std::move(conn), std::move(sink));
}

MirrorSignals StreamRelay::mirror(MessageConnPtr conn, WriterPtr sink, ReaderPtr source) const {
    MirrorSignals signals;
    signals.readDone = mirrorRead(conn, std::move(source));
    signals.writeDone = mirrorWrite(conn, std::move(sink));
    return signals;
}

SignalPtr StreamRelay::proxy(MessageConnPtr a, MessageConnPtr b) const {
    auto state = std::make_shared<ProxyState>();
    state->a = std::move(a);
    state->b = std::move(b);
    state->logger = m_logger;

    std::thread([state] {
        copyLoop(state, state->a, state->b, "a->b");
    }).detach();

    std::thread([state] {
        copyLoop(state, state->b, state->a, "b->a");
    }).detach();

    return state->done;
}

} // namespace stevedore::core::stream
