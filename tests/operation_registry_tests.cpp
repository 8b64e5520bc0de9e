// operation_registry_tests.cpp
// Operation lookup and purge of finished operations

#include <boost/ut.hpp>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/operation/OperationRegistry.hpp"

#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

int main() {
  using namespace boost::ut;
  using namespace stevedore::core;
  using namespace stevedore::core::operation;

  "create_and_get"_test = [] {
    Config config;
    OperationRegistry registry(config);

    OperationArgs args;
    args.opClass = OperationClass::Token;
    auto op = registry.create(std::move(args));

    expect(registry.get(op->id()) == op);
    expect(registry.size() == 1_ul);
    expect(registry.clone().count(op->id()) == 1_ul);
  };

  "unknown_id"_test = [] {
    Config config;
    OperationRegistry registry(config);
    expect(throws<NotFoundError>([&] { registry.get("0e4d0c5e-unknown"); }));
  };

  "finished_operations_are_purged_after_retention"_test = [] {
    Config config;
    config.set("operations.retention", 50);
    OperationRegistry registry(config);

    OperationArgs finishing;
    finishing.opClass = OperationClass::Token;
    auto done = registry.create(std::move(finishing));

    OperationArgs running;
    running.opClass = OperationClass::Token;
    auto pending = registry.create(std::move(running));
    pending->start();

    done->start();
    done->cancel();
    expect(done->waitFor(1s));

    // Still visible within the retention period
    expect(registry.get(done->id()) == done);

    std::this_thread::sleep_for(100ms);

    expect(throws<NotFoundError>([&] { registry.get(done->id()); }));
    expect(registry.get(pending->id()) == pending);
    expect(registry.size() == 1_ul);
  };

  "rejects_invalid_hooks"_test = [] {
    Config config;
    OperationRegistry registry(config);

    OperationArgs args;
    args.opClass = OperationClass::Websocket;
    expect(throws<OperationError>([&] { registry.create(std::move(args)); }));
    expect(registry.size() == 0_ul);
  };
}
