#pragma once

/**
 * CancelableDownload.hpp
 *
 * A single HTTP request that can be aborted through a Canceler.
 */

#include "../Logger.hpp"
#include "../cancel/Canceler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace stevedore::core::downloader {

/**
 * Receives the response body chunk by chunk.
 * Returning false aborts the transfer.
 */
using BodySink = std::function<bool(std::string_view chunk)>;

/**
 * Transfer progress: bytes received so far and expected total (0 if unknown)
 */
using TransferProgressCallback = std::function<void(int64_t downloaded, int64_t total)>;

/**
 * Request descriptor
 */
struct DownloadRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string userAgent{"stevedore/1.0"};

    // 0 = no deadline; the caller imposes one if it wants it
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{0};

    // When set the body is streamed here instead of being buffered
    BodySink sink;
    TransferProgressCallback progress;
};

struct DownloadResponse {
    long statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;
    int64_t contentLength{-1};
    double elapsed{0.0};

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }
};

/**
 * DownloadHandle - the caller's side of a finished request
 *
 * Closing it tells the Canceler the response has been consumed, so the
 * request stops being cancelable. A handle destroyed while still open
 * closes itself.
 */
class DownloadHandle {
public:
    DownloadHandle() = default;
    DownloadHandle(std::shared_ptr<cancel::Canceler> canceler, cancel::RequestId id);
    ~DownloadHandle();

    DownloadHandle(const DownloadHandle&) = delete;
    DownloadHandle& operator=(const DownloadHandle&) = delete;

    DownloadHandle(DownloadHandle&& other) noexcept;
    DownloadHandle& operator=(DownloadHandle&& other) noexcept;

    /**
     * Mark the response as consumed
     * @throws std::logic_error if the handle was already closed
     */
    void close();

    bool isOpen() const { return m_open; }
    cancel::RequestId requestId() const { return m_id; }

private:
    void release() noexcept;

    std::shared_ptr<cancel::Canceler> m_canceler;
    cancel::RequestId m_id{0};
    bool m_open{false};
};

struct DownloadResult {
    DownloadResponse response;
    DownloadHandle done;
};

/**
 * CancelableDownload - performs blocking HTTP GET requests wired to a
 * cancellation signal
 *
 * Features:
 * - Registration with an optional Canceler for the duration of the call
 * - Abort at the next I/O boundary once the signal fires
 * - Streaming body sink and progress reporting
 */
class CancelableDownload {
public:
    explicit CancelableDownload(LoggerPtr logger = nullptr);

    /**
     * Perform the request
     * @param request Request descriptor
     * @param canceler Canceler to register with (may be null)
     * @return Response and the handle to close once it is consumed
     * @throws RequestCancelledError if the Canceler aborted the call
     * @throws TransportError on network, DNS or TLS failure
     */
    DownloadResult perform(const DownloadRequest& request,
                           const std::shared_ptr<cancel::Canceler>& canceler = nullptr);

private:
    LoggerPtr m_logger;
};

} // namespace stevedore::core::downloader
