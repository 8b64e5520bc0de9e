// stream_relay_tests.cpp
// Reader and writer pumps, mirror and proxy over in-memory transports

#include <boost/ut.hpp>

#include "core/stream/StreamRelay.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;
using stevedore::testing::ChunkReader;
using stevedore::testing::MemoryConn;
using stevedore::testing::StringWriter;

int main() {
  using namespace boost::ut;
  using namespace stevedore::core;
  using namespace stevedore::core::stream;

  "reader_pump_keeps_order_and_length"_test = [] {
    StreamRelay relay;
    auto source = std::make_shared<ChunkReader>(std::vector<std::string>{"ab", "cde", "f", "ghij"});

    auto channel = relay.readerToChannel(source);

    std::string received;
    while (auto chunk = channel->receive()) {
      expect(!chunk->empty());
      received += *chunk;
    }

    expect(eq(received, std::string("abcdefghij")));
    expect(received.size() == 10_ul);
    expect(channel->isClosed());
  };

  "reader_pump_splits_on_buffer_size"_test = [] {
    StreamRelay relay(nullptr, 4);
    auto source = std::make_shared<ChunkReader>(std::vector<std::string>{"0123456789"});

    auto channel = relay.readerToChannel(source);

    std::vector<std::string> chunks;
    while (auto chunk = channel->receive()) {
      chunks.push_back(*chunk);
    }

    expect(chunks.size() == 3_ul);
    expect(eq(chunks[0], std::string("0123")));
    expect(eq(chunks[2], std::string("89")));
  };

  "fd_streams_over_pipe"_test = [] {
    int fds[2];
    expect(::pipe(fds) == 0_i);

    StreamRelay relay;
    auto [local, remote] = MemoryConn::pair();
    auto writer = std::make_shared<FdWriter>(fds[1]);

    remote->writeMessage(Message::data("through "));
    remote->writeMessage(Message::data("a pipe"));
    remote->writeMessage(Message::barrier());

    // The writer pump closes the write end, the reader pump sees EOF
    auto written = relay.defaultWriter(local, writer);
    auto channel = relay.readerToChannel(std::make_shared<FdReader>(fds[0]));

    std::string received;
    while (auto chunk = channel->receive()) {
      received += *chunk;
    }

    expect(written->waitFor(5s));
    expect(eq(received, std::string("through a pipe")));
  };

  "writer_pump_stops_at_barrier_without_closing_transport"_test = [] {
    StreamRelay relay;
    auto [local, remote] = MemoryConn::pair();
    auto sink = std::make_shared<StringWriter>();

    remote->writeMessage(Message::data("hello "));
    remote->writeMessage(Message::data("world"));
    remote->writeMessage(Message::barrier());

    auto done = relay.defaultWriter(local, sink);
    expect(done->waitFor(5s));

    expect(eq(sink->data(), std::string("hello world")));
    expect(sink->closeCalls() == 1_i);
    expect(local->closeCalls() == 0_i);

    // The transport is still usable in both directions
    remote->writeMessage(Message::data("more"));
    Message message = local->readMessage();
    expect(message.type == MessageType::Data);
    expect(eq(message.payload, std::string("more")));

    local->writeMessage(Message::data("back"));
    expect(eq(remote->readMessage().payload, std::string("back")));
  };

  "writer_pump_stops_on_close"_test = [] {
    StreamRelay relay;
    auto [local, remote] = MemoryConn::pair();
    auto sink = std::make_shared<StringWriter>();

    auto done = relay.defaultWriter(local, sink);
    remote->writeMessage(Message::data("bye"));
    remote->close();

    expect(done->waitFor(5s));
    expect(eq(sink->data(), std::string("bye")));
    expect(sink->closeCalls() == 1_i);
  };

  "writer_pump_stops_on_short_write"_test = [] {
    StreamRelay relay;
    auto [local, remote] = MemoryConn::pair();
    auto sink = std::make_shared<StringWriter>(4);

    remote->writeMessage(Message::data("abc"));
    remote->writeMessage(Message::data("defg"));
    remote->writeMessage(Message::data("never written"));

    auto done = relay.defaultWriter(local, sink);
    expect(done->waitFor(5s));

    expect(eq(sink->data(), std::string("abcd")));
    expect(sink->closeCalls() == 1_i);
    expect(eq(local->readMessage().payload, std::string("never written")));
  };

  "mirror_sends_data_then_one_barrier"_test = [] {
    StreamRelay relay;
    auto [local, remote] = MemoryConn::pair();
    auto source = std::make_shared<ChunkReader>(std::vector<std::string>{"ls -la\n", "exit\n"});
    auto sink = std::make_shared<StringWriter>();

    auto signals = relay.mirror(local, sink, source);
    expect(signals.readDone->waitFor(5s));

    std::string sent;
    while (true) {
      Message message = remote->readMessage();
      if (message.type != MessageType::Data) {
        expect(message.type == MessageType::Barrier);
        break;
      }
      sent += message.payload;
    }
    expect(eq(sent, std::string("ls -la\nexit\n")));

    // The write half is independent of the read half
    expect(!signals.writeDone->isFired());

    remote->writeMessage(Message::data("total 0\n"));
    remote->writeMessage(Message::barrier());

    expect(signals.writeDone->waitFor(5s));
    expect(eq(sink->data(), std::string("total 0\n")));
    expect(local->closeCalls() == 0_i);
  };

  "mirror_read_on_empty_source"_test = [] {
    StreamRelay relay;
    auto [local, remote] = MemoryConn::pair();

    auto done = relay.mirrorRead(local, std::make_shared<ChunkReader>(std::vector<std::string>{}));
    expect(done->waitFor(5s));
    expect(remote->readMessage().type == MessageType::Barrier);
  };

  "proxy_forwards_both_ways"_test = [] {
    StreamRelay relay;
    auto [clientA, proxyA] = MemoryConn::pair();
    auto [proxyB, clientB] = MemoryConn::pair();

    auto done = relay.proxy(proxyA, proxyB);

    clientA->writeMessage(Message::data("ping"));
    expect(eq(clientB->readMessage().payload, std::string("ping")));

    clientB->writeMessage(Message::barrier());
    expect(clientA->readMessage().type == MessageType::Barrier);

    clientB->writeMessage(Message::data("pong"));
    expect(eq(clientA->readMessage().payload, std::string("pong")));

    expect(!done->isFired());

    clientA->close();
    expect(done->waitFor(5s));
  };

  "proxy_closes_each_connection_once"_test = [] {
    StreamRelay relay;
    auto [clientA, proxyA] = MemoryConn::pair();
    auto [proxyB, clientB] = MemoryConn::pair();

    auto done = relay.proxy(proxyA, proxyB);

    clientB->close();
    expect(done->waitFor(5s));

    expect(proxyA->closeCalls() == 1_i);
    expect(proxyB->closeCalls() == 1_i);
    expect(clientA->readMessage().type == MessageType::Close);
  };
}
