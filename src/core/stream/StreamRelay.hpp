#pragma once

/**
 * StreamRelay.hpp
 *
 * Pumps that move bytes between blocking byte streams and message
 * transports: reader pump, writer pump, mirror and proxy.
 */

#include "ByteStream.hpp"
#include "MessageConn.hpp"
#include "../Channel.hpp"
#include "../Logger.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace stevedore::core::stream {

using ByteChannel = Channel<std::string>;
using ByteChannelPtr = std::shared_ptr<ByteChannel>;
using SignalPtr = std::shared_ptr<Signal>;

/**
 * Completion signals of the two halves of a mirror
 */
struct MirrorSignals {
    SignalPtr readDone;     // source exhausted, barrier sent
    SignalPtr writeDone;    // transport drained into the sink
};

/**
 * StreamRelay - starts one detached thread per pump direction
 *
 * Every pump ends on its own: on end of stream, error, or closure of the
 * other side. Errors are logged and terminate only their direction.
 */
class StreamRelay {
public:
    static constexpr size_t DefaultBufferSize = 32 * 1024;

    explicit StreamRelay(LoggerPtr logger = nullptr, size_t bufferSize = DefaultBufferSize);

    /**
     * Reader pump: forward each non-empty read of source as one channel
     * item, in read order. The channel is closed on end of stream or error.
     * Closing the channel from the consumer side stops the pump after its
     * current read.
     */
    ByteChannelPtr readerToChannel(ReaderPtr source) const;

    /**
     * Writer pump: write each Data payload read from conn into sink. Stops
     * on Close, Barrier, transport error or partial write, then closes the
     * sink. The transport is left open.
     * @return Signal fired when the pump has stopped
     */
    SignalPtr defaultWriter(MessageConnPtr conn, WriterPtr sink) const;

    /**
     * Forward source to conn as Data messages, then one Barrier
     * @return Signal fired once source is exhausted
     */
    SignalPtr mirrorRead(MessageConnPtr conn, ReaderPtr source) const;

    /**
     * Drain conn into sink (same as defaultWriter)
     */
    SignalPtr mirrorWrite(MessageConnPtr conn, WriterPtr sink) const;

    /**
     * Both halves over the same transport; they complete independently
     */
    MirrorSignals mirror(MessageConnPtr conn, WriterPtr sink, ReaderPtr source) const;

    /**
     * Copy messages between two transports in both directions. The first
     * direction to hit an error or a Close closes both transports, each
     * exactly once. Barriers are forwarded.
     * @return Signal fired once both directions have stopped
     */
    SignalPtr proxy(MessageConnPtr a, MessageConnPtr b) const;

    size_t bufferSize() const { return m_bufferSize; }

private:
    LoggerPtr m_logger;
    size_t m_bufferSize;
};

} // namespace stevedore::core::stream
