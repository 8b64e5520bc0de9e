#pragma once

/**
 * ImageFetcher.hpp
 *
 * Image transfer: downloads an image file over HTTP(S) through
 * CancelableDownload, verifying its SHA-256 fingerprint on the fly.
 */

#include "CancelableDownload.hpp"
#include "../Config.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace stevedore::core::downloader {

/**
 * Progress text callback, e.g. "45% (1.2 MB/s)"
 */
using ProgressTextCallback = std::function<void(const std::string& text)>;

struct FetchRequest {
    std::string url;
    std::string destination;

    // Expected fingerprint, lowercase hex (optional)
    std::string sha256;

    std::map<std::string, std::string> headers;
};

struct FetchResult {
    std::string fingerprint;
    int64_t size{0};
    int attempts{0};
};

/**
 * ImageFetcher - image download with verification and retry
 *
 * Features:
 * - Streaming to disk while hashing
 * - Fingerprint verification
 * - Retry with linear backoff for transport failures
 * - No retry after cancellation
 * - Partial files are removed on failure
 */
class ImageFetcher {
public:
    ImageFetcher(const Config& config, LoggerPtr logger = nullptr);

    /**
     * Fetch an image
     * @param request What to fetch and where to
     * @param canceler Canceler of the owning operation (may be null)
     * @param progress Progress text callback (may be null)
     * @return Fingerprint and size of the stored file
     * @throws RequestCancelledError if cancelled
     * @throws TransportError if every attempt failed
     */
    FetchResult fetch(const FetchRequest& request,
                      const std::shared_ptr<cancel::Canceler>& canceler = nullptr,
                      ProgressTextCallback progress = nullptr);

private:
    /**
     * One attempt; writes the file and returns its fingerprint
     */
    FetchResult fetchOnce(const FetchRequest& request,
                          const std::shared_ptr<cancel::Canceler>& canceler,
                          const ProgressTextCallback& progress);

private:
    LoggerPtr m_logger;
    CancelableDownload m_download;

    int m_retryCount;
    int m_retryDelay;
    int m_timeout;
    int m_connectTimeout;
    std::string m_userAgent;
};

} // namespace stevedore::core::downloader
