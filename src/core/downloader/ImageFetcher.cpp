/**
 * ImageFetcher.cpp
 *
 * Implementation of the image fetcher.
 */

#include "ImageFetcher.hpp"
#include "../Errors.hpp"
#include "../../utils/Crypto.hpp"
#include "../../utils/StringUtils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace stevedore::core::downloader {

ImageFetcher::ImageFetcher(const Config& config, LoggerPtr logger)
    : m_logger(orNullLogger(std::move(logger)))
    , m_download(m_logger)
    , m_retryCount(config.get<int>("downloads.retryCount", 3))
    , m_retryDelay(config.get<int>("downloads.retryDelay", 1000))
    , m_timeout(config.get<int>("downloads.timeout", 0))
    , m_connectTimeout(config.get<int>("downloads.connectTimeout", 30000))
    , m_userAgent(config.get<std::string>("downloads.userAgent", "stevedore/1.0")) {
}

FetchResult ImageFetcher::fetch(const FetchRequest& request,
                                const std::shared_ptr<cancel::Canceler>& canceler,
                                ProgressTextCallback progress) {
    std::string lastError;

    for (int attempt = 0; attempt <= m_retryCount; ++attempt) {
        if (attempt > 0) {
            m_logger->debug("Retry {} for {}", attempt, request.url);
            std::this_thread::sleep_for(std::chrono::milliseconds(m_retryDelay * attempt));
        }

        try {
            FetchResult result = fetchOnce(request, canceler, progress);
            result.attempts = attempt + 1;

            m_logger->info("Fetched {} ({}, sha256 {})", request.url,
                           utils::StringUtils::formatBytes(result.size), result.fingerprint);
            return result;

        } catch (const RequestCancelledError&) {
            std::filesystem::remove(request.destination);
            throw;
        } catch (const std::exception& e) {
            lastError = e.what();
            std::filesystem::remove(request.destination);
            m_logger->warn("Image fetch error: {} - {}", request.url, e.what());
        }
    }

    m_logger->error("Image fetch failed after {} retries: {}", m_retryCount, request.url);
    throw TransportError(lastError);
}

FetchResult ImageFetcher::fetchOnce(const FetchRequest& request,
                                    const std::shared_ptr<cancel::Canceler>& canceler,
                                    const ProgressTextCallback& progress) {
    auto parent = std::filesystem::path(request.destination).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(request.destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file " + request.destination);
    }

    utils::Sha256 hasher;
    int64_t written = 0;
    auto startTime = std::chrono::steady_clock::now();
    std::string lastProgress;

    DownloadRequest download;
    download.url = request.url;
    download.headers = request.headers;
    download.userAgent = m_userAgent;
    download.timeout = std::chrono::milliseconds(m_timeout);
    download.connectTimeout = std::chrono::milliseconds(m_connectTimeout);

    download.sink = [&](std::string_view chunk) {
        file.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!file) {
            return false;
        }

        hasher.update(chunk);
        written += static_cast<int64_t>(chunk.size());
        return true;
    };

    download.progress = [&](int64_t downloaded, int64_t total) {
        if (!progress || total <= 0) {
            return;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();
        int64_t speed = elapsed > 0 ? downloaded * 1000 / elapsed : 0;
        int64_t percent = downloaded * 100 / total;

        std::string text = std::to_string(percent) + "% (" +
                           utils::StringUtils::formatBytes(speed) + "/s)";

        // Only report changes
        if (text != lastProgress) {
            lastProgress = text;
            progress(text);
        }
    };

    DownloadResult result = m_download.perform(download, canceler);

    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write " + request.destination);
    }

    if (!result.response.isSuccess()) {
        throw TransportError("Unable to fetch " + request.url + ": HTTP " +
                             std::to_string(result.response.statusCode));
    }

    std::string fingerprint = hasher.finalHex();
    std::string expected = utils::StringUtils::toLower(request.sha256);
    if (!expected.empty() && fingerprint != expected) {
        throw std::runtime_error("Image fingerprint doesn't match. Got " + fingerprint +
                                 " expected " + expected);
    }

    result.done.close();

    return FetchResult{fingerprint, written, 0};
}

} // namespace stevedore::core::downloader
