// stream_endpoints_tests.cpp
// One-time stream secrets

#include <boost/ut.hpp>

#include "core/Errors.hpp"
#include "core/stream/StreamEndpoints.hpp"
#include "TestSupport.hpp"

#include <set>
#include <string>

using stevedore::testing::MemoryConn;

int main() {
  using namespace boost::ut;
  using namespace stevedore::core;
  using namespace stevedore::core::stream;

  "one_secret_per_channel"_test = [] {
    StreamEndpoints endpoints(StreamEndpoints::commandChannels(false));
    auto secrets = endpoints.metadata().fds;

    expect(secrets.size() == 4_ul);
    expect(secrets.count("control") == 1_ul);
    expect(secrets.count("2") == 1_ul);

    std::set<std::string> distinct;
    for (const auto& [name, secret] : secrets) {
      expect(secret.size() == 64_ul);
      distinct.insert(secret);
    }
    expect(distinct.size() == 4_ul);
  };

  "interactive_channels"_test = [] {
    auto channels = StreamEndpoints::commandChannels(true);
    expect(channels.size() == 2_ul);
  };

  "secret_authorizes_once"_test = [] {
    StreamEndpoints endpoints({"control", "0"});
    auto secrets = endpoints.metadata().fds;

    auto conn = MemoryConn::pair().first;
    expect(eq(endpoints.connect(secrets["0"], conn), std::string("0")));
    expect(endpoints.get("0") == conn);

    expect(throws<OperationError>([&] {
      endpoints.connect(secrets["0"], MemoryConn::pair().first);
    }));
    expect(endpoints.get("0") == conn);
  };

  "unknown_secret_is_denied"_test = [] {
    StreamEndpoints endpoints({"control", "0"});

    expect(throws<PermissionDeniedError>([&] {
      endpoints.connect("not-a-secret", MemoryConn::pair().first);
    }));
    expect(throws<PermissionDeniedError>([&] {
      endpoints.connect("", MemoryConn::pair().first);
    }));
    expect(endpoints.get("control") == nullptr);
  };

  "signal_when_all_connected"_test = [] {
    StreamEndpoints endpoints({"control", "0"});
    auto secrets = endpoints.metadata().fds;

    endpoints.connect(secrets["0"], MemoryConn::pair().first);
    expect(!endpoints.allConnected());
    expect(!endpoints.connectedSignal()->isFired());

    endpoints.connect(secrets["control"], MemoryConn::pair().first);
    expect(endpoints.allConnected());
    expect(endpoints.connectedSignal()->isFired());
  };

  "close_all"_test = [] {
    StreamEndpoints endpoints({"0"});
    auto secrets = endpoints.metadata().fds;

    auto [local, remote] = MemoryConn::pair();
    endpoints.connect(secrets["0"], local);
    endpoints.closeAll();

    expect(local->closeCalls() == 1_i);
    expect(remote->readMessage().type == MessageType::Close);
  };
}
