/**
 * Stevedore - operation and stream relay daemon
 *
 * Main entry point.
 * Runs a single operation from the command line: an image fetch, a
 * stream attach or a stream serve, cancellable with SIGINT/SIGTERM.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/cancel/Canceler.hpp"
#include "core/downloader/ImageFetcher.hpp"
#include "core/operation/OperationRegistry.hpp"
#include "core/stream/ByteStream.hpp"
#include "core/stream/StreamEndpoints.hpp"
#include "core/stream/StreamRelay.hpp"
#include "core/stream/WebSocketConn.hpp"

using namespace stevedore::core;

namespace {

const char* const Version = "1.0.0";

std::atomic<bool> g_interrupted{false};

/**
 * Signal handler: the main loop turns the flag into a cancel request
 */
void signalHandler(int) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cout << "stevedored - operation and stream relay daemon\n"
              << "\nUsage: " << program << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  fetch <url> <dest> [--sha256 <hex>]  Download an image\n"
              << "  attach <host> <port> <target>         Mirror stdin/stdout over a websocket\n"
              << "  serve <port>                          Serve stdin/stdout to websocket clients\n"
              << "\nOptions:\n"
              << "  -c, --config <file>  Load configuration from file\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Wait for the operation, forwarding interrupts as cancel requests
 */
void waitForOperation(const operation::OperationPtr& op, const LoggerPtr& logger) {
    while (!op->waitFor(std::chrono::milliseconds(200))) {
        if (!g_interrupted.exchange(false)) {
            continue;
        }

        logger->info("Interrupted, cancelling operation {}", op->id());

        try {
            op->cancel();
        } catch (const NotCancelableError& e) {
            logger->warn("{}", e.what());
        } catch (const std::exception& e) {
            logger->error("Failed to cancel operation: {}", e.what());
        }
    }
}

operation::OperationPtr startFetch(operation::OperationRegistry& registry,
                                   const Config& config,
                                   const LoggerPtr& logger,
                                   downloader::FetchRequest request) {
    auto fetcher = std::make_shared<downloader::ImageFetcher>(config, logger);
    auto canceler = std::make_shared<cancel::Canceler>(logger);

    operation::OperationArgs args;
    args.opClass = operation::OperationClass::Task;
    args.description = "Downloading image";
    args.resources["images"] = {request.destination};
    args.task.canceler = canceler;
    args.task.run = [fetcher, canceler, request](operation::Operation& op) -> std::optional<operation::Metadata> {
        auto result = fetcher->fetch(request, canceler, [&op](const std::string& text) {
            op.updateMetadata(operation::ProgressMetadata{"download", text});
        });

        json summary = {
            {"fingerprint", result.fingerprint},
            {"size", result.size}
        };
        return operation::OpaqueMetadata{summary.dump()};
    };

    auto op = registry.create(std::move(args));
    op->start();
    return op;
}

operation::OperationPtr startAttach(operation::OperationRegistry& registry,
                                    const Config& config,
                                    const LoggerPtr& logger,
                                    const std::string& host,
                                    const std::string& port,
                                    const std::string& target) {
    auto conn = stream::WebSocketConn::connect(host, port, target, logger);
    auto relay = std::make_shared<stream::StreamRelay>(
        logger, config.get<size_t>("streams.readBufferSize", stream::StreamRelay::DefaultBufferSize));

    operation::OperationArgs args;
    args.opClass = operation::OperationClass::Task;
    args.description = "Attaching to " + target;
    args.task.cancel = [conn](operation::Operation&) {
        conn->close();
    };
    args.task.run = [conn, relay](operation::Operation&) -> std::optional<operation::Metadata> {
        auto signals = relay->mirror(conn,
                                     std::make_shared<stream::FdWriter>(STDOUT_FILENO, false),
                                     std::make_shared<stream::FdReader>(STDIN_FILENO, false));

        // The remote side ends the session
        signals.writeDone->wait();
        conn->close();
        return std::nullopt;
    };

    auto op = registry.create(std::move(args));
    op->start();
    return op;
}

/**
 * Secret from a request target such as "/websocket?secret=abc"
 */
std::string secretFromTarget(const std::string& target) {
    auto pos = target.find("secret=");
    if (pos == std::string::npos) {
        return "";
    }

    auto value = target.substr(pos + 7);
    return value.substr(0, value.find('&'));
}

/**
 * Hand incoming connections to the operation until every stream channel
 * is connected or the operation finished. Holds the io_context the
 * acceptor runs on.
 */
void acceptStreams(std::shared_ptr<boost::asio::io_context> ioc,
                   std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor,
                   operation::OperationPtr op,
                   std::shared_ptr<stream::StreamEndpoints> endpoints,
                   LoggerPtr logger) {
    while (!endpoints->allConnected() && !op->isFinished()) {
        std::shared_ptr<stream::WebSocketConn> conn;

        try {
            conn = stream::WebSocketConn::accept(*acceptor, logger);
        } catch (const TransportError& e) {
            logger->warn("Stream connection failed: {}", e.what());
            continue;
        }

        try {
            op->connect(secretFromTarget(conn->target()), conn);
        } catch (const PermissionDeniedError& e) {
            logger->warn("Rejected stream connection: {}", e.what());
            conn->close();
        } catch (const OperationError& e) {
            logger->warn("Rejected stream connection: {}", e.what());
            conn->close();
        }
    }

    logger->debug("Stopped accepting stream connections");
}

operation::OperationPtr startServe(operation::OperationRegistry& registry,
                                   const Config& config,
                                   const LoggerPtr& logger,
                                   const std::string& port) {
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    auto ioc = std::make_shared<asio::io_context>();
    auto acceptor = std::make_shared<tcp::acceptor>(
        *ioc, tcp::endpoint(tcp::v4(), static_cast<unsigned short>(std::stoi(port))));

    auto endpoints = std::make_shared<stream::StreamEndpoints>(
        stream::StreamEndpoints::commandChannels(true), logger);
    auto relay = std::make_shared<stream::StreamRelay>(
        logger, config.get<size_t>("streams.readBufferSize", stream::StreamRelay::DefaultBufferSize));

    operation::OperationArgs args;
    args.opClass = operation::OperationClass::Websocket;
    args.description = "Serving stdin/stdout on port " + port;
    args.metadata = endpoints->metadata();
    args.task.connect = [endpoints](operation::Operation&, const std::string& secret,
                                    stream::MessageConnPtr conn) {
        endpoints->connect(secret, std::move(conn));
    };
    args.task.cancel = [endpoints](operation::Operation&) {
        endpoints->closeAll();
    };
    args.task.run = [endpoints, relay](operation::Operation& op) -> std::optional<operation::Metadata> {
        auto connected = endpoints->connectedSignal();
        while (!connected->waitFor(std::chrono::milliseconds(200))) {
            if (op.isFinished()) {
                return std::nullopt;
            }
        }

        auto signals = relay->mirror(endpoints->get("0"),
                                     std::make_shared<stream::FdWriter>(STDOUT_FILENO, false),
                                     std::make_shared<stream::FdReader>(STDIN_FILENO, false));

        signals.writeDone->wait();
        endpoints->closeAll();
        return std::nullopt;
    };

    auto op = registry.create(std::move(args));
    op->start();

    // Clients need the secrets to connect
    std::cout << op->render().dump(4) << std::endl;

    std::thread(acceptStreams, ioc, acceptor, op, endpoints, logger).detach();
    return op;
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    bool debugMode = false;
    std::string configPath;
    std::string sha256;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--sha256" && i + 1 < argc) {
            sha256 = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "stevedored v" << Version << std::endl;
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    Config config;
    if (!configPath.empty() && !config.load(configPath)) {
        std::cerr << "Failed to load configuration from " << configPath << std::endl;
        return 1;
    }

    // Initialize logger
    LogLevel level = debugMode ? LogLevel::Debug
                               : parseLogLevel(config.get<std::string>("logging.level", "info"));
    auto logger = Logger::create("stevedored", level, config.get<std::string>("logging.directory", ""));

    logger->info("stevedored v{} starting...", Version);

    setupSignalHandlers();

    auto events = std::make_shared<EventBus>(logger);
    auto subscription = events->subscribe("operation", [logger](const json& op) {
        logger->debug("Operation {}: {}", op.value("id", ""), op.value("status", ""));
    });

    operation::OperationRegistry registry(config, events, logger);

    try {
        operation::OperationPtr op;
        const std::string& command = positional[0];

        if (command == "fetch" && positional.size() == 3) {
            downloader::FetchRequest request;
            request.url = positional[1];
            request.destination = positional[2];
            request.sha256 = sha256;
            op = startFetch(registry, config, logger, std::move(request));
        } else if (command == "attach" && positional.size() == 4) {
            op = startAttach(registry, config, logger, positional[1], positional[2], positional[3]);
        } else if (command == "serve" && positional.size() == 2) {
            op = startServe(registry, config, logger, positional[1]);
        } else {
            printUsage(argv[0]);
            return 2;
        }

        waitForOperation(op, logger);
        events->unsubscribe(subscription);

        std::cout << op->render().dump(4) << std::endl;
        return op->status() == operation::StatusCode::Success ? 0 : 1;

    } catch (const std::exception& e) {
        logger->critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
