// cancelable_download_tests.cpp
// HTTP requests registered with a Canceler

#include <boost/ut.hpp>

#include "core/Errors.hpp"
#include "core/cancel/Canceler.hpp"
#include "core/downloader/CancelableDownload.hpp"
#include "HttpTestServer.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using stevedore::testing::HttpTestServer;

int main() {
  using namespace boost::ut;
  using namespace stevedore::core;
  using namespace stevedore::core::downloader;

  HttpTestServer server([](HttpTestServer::tcp::socket& socket, const std::string& target) {
    if (target == "/slow") {
      HttpTestServer::trickle(socket, 50ms);
    } else if (target == "/missing") {
      HttpTestServer::respond(socket, 404, "not found");
    } else {
      HttpTestServer::respond(socket, 200, "hello world");
    }
  });

  "buffered_response"_test = [&] {
    auto canceler = std::make_shared<cancel::Canceler>();
    CancelableDownload download;

    DownloadRequest request;
    request.url = server.url("/hello");

    auto result = download.perform(request, canceler);
    expect(result.response.isSuccess());
    expect(eq(result.response.body, std::string("hello world")));
    expect(result.response.contentLength == 11);

    // Still registered until the response is consumed
    expect(canceler->cancelable());
    expect(result.done.isOpen());

    result.done.close();
    expect(!canceler->cancelable());
    expect(throws<std::logic_error>([&] { result.done.close(); }));
  };

  "handle_closes_itself"_test = [&] {
    auto canceler = std::make_shared<cancel::Canceler>();
    CancelableDownload download;

    DownloadRequest request;
    request.url = server.url("/hello");

    {
      auto result = download.perform(request, canceler);
      expect(canceler->cancelable());
    }

    expect(!canceler->cancelable());
  };

  "streamed_response"_test = [&] {
    CancelableDownload download;
    std::string received;

    DownloadRequest request;
    request.url = server.url("/hello");
    request.sink = [&received](std::string_view chunk) {
      received.append(chunk.data(), chunk.size());
      return true;
    };

    auto result = download.perform(request);
    expect(eq(received, std::string("hello world")));
    expect(result.response.body.empty());
  };

  "http_errors_are_responses"_test = [&] {
    CancelableDownload download;

    DownloadRequest request;
    request.url = server.url("/missing");

    auto result = download.perform(request);
    expect(!result.response.isSuccess());
    expect(result.response.statusCode == 404);
  };

  "transport_error"_test = [] {
    auto canceler = std::make_shared<cancel::Canceler>();
    CancelableDownload download;

    // Grab a free port and release it again
    unsigned short port;
    {
      boost::asio::io_context ioc;
      HttpTestServer::tcp::acceptor acceptor(
          ioc, HttpTestServer::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
      port = acceptor.local_endpoint().port();
    }

    DownloadRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/";

    expect(throws<TransportError>([&] { download.perform(request, canceler); }));
    expect(!canceler->cancelable());
  };

  "cancel_aborts_concurrent_downloads"_test = [&] {
    auto canceler = std::make_shared<cancel::Canceler>();
    CancelableDownload download;

    auto firstStarted = std::make_shared<Signal>();
    auto secondStarted = std::make_shared<Signal>();
    std::atomic<int> cancelled{0};
    std::atomic<int> otherErrors{0};

    auto run = [&](std::shared_ptr<Signal> started) {
      DownloadRequest request;
      request.url = server.url("/slow");
      request.sink = [started](std::string_view) {
        started->tryFire();
        return true;
      };

      try {
        download.perform(request, canceler);
      } catch (const RequestCancelledError&) {
        ++cancelled;
      } catch (const std::exception&) {
        ++otherErrors;
      }
    };

    std::thread first(run, firstStarted);
    std::thread second(run, secondStarted);

    expect(firstStarted->waitFor(5s));
    expect(secondStarted->waitFor(5s));
    expect(canceler->cancelable());

    auto cancelAt = std::chrono::steady_clock::now();
    canceler->cancel();

    first.join();
    second.join();

    auto elapsed = std::chrono::steady_clock::now() - cancelAt;
    expect(elapsed < 3s);

    expect(cancelled.load() == 2_i);
    expect(otherErrors.load() == 0_i);
    expect(!canceler->cancelable());
    expect(throws<NotCancelableError>([&] { canceler->cancel(); }));
  };
}
