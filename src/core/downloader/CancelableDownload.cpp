/**
 * CancelableDownload.cpp
 *
 * HTTP transfers using cpr (which wraps libcurl). Cancellation goes through
 * the progress callback: libcurl invokes it regularly, also while the
 * connection is idle, and aborts the transfer once it returns false.
 */

#include "CancelableDownload.hpp"
#include "../Errors.hpp"

#include <cpr/cpr.h>

#include <exception>
#include <stdexcept>

namespace stevedore::core::downloader {

// -- DownloadHandle --

DownloadHandle::DownloadHandle(std::shared_ptr<cancel::Canceler> canceler, cancel::RequestId id)
    : m_canceler(std::move(canceler)), m_id(id), m_open(true) {}

DownloadHandle::~DownloadHandle() {
    release();
}

DownloadHandle::DownloadHandle(DownloadHandle&& other) noexcept
    : m_canceler(std::move(other.m_canceler)), m_id(other.m_id), m_open(other.m_open) {
    other.m_open = false;
}

DownloadHandle& DownloadHandle::operator=(DownloadHandle&& other) noexcept {
    if (this != &other) {
        release();
        m_canceler = std::move(other.m_canceler);
        m_id = other.m_id;
        m_open = other.m_open;
        other.m_open = false;
    }
    return *this;
}

void DownloadHandle::close() {
    if (!m_open) {
        throw std::logic_error("download handle already closed");
    }
    release();
}

void DownloadHandle::release() noexcept {
    if (!m_open) return;

    m_open = false;
    if (m_canceler) {
        m_canceler->deregister(m_id);
    }
}

// -- CancelableDownload --

CancelableDownload::CancelableDownload(LoggerPtr logger)
    : m_logger(orNullLogger(std::move(logger))) {
}

DownloadResult CancelableDownload::perform(const DownloadRequest& request,
                                           const std::shared_ptr<cancel::Canceler>& canceler) {
    cancel::RequestId id = cancel::Canceler::nextRequestId();
    cancel::CancelSignal signal = canceler
        ? canceler->registerRequest(id)
        : std::make_shared<Signal>();

    // Deregisters on every exit path until handed to the caller
    DownloadHandle done(canceler, id);

    // Callbacks run inside libcurl; exceptions are carried out by hand
    std::exception_ptr callbackError;

    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetUserAgent(cpr::UserAgent{request.userAgent});

    cpr::Header header;
    for (const auto& [key, value] : request.headers) header[key] = value;
    session.SetHeader(header);

    if (request.timeout.count() > 0) {
        session.SetTimeout(cpr::Timeout{request.timeout});
    }
    if (request.connectTimeout.count() > 0) {
        session.SetConnectTimeout(cpr::ConnectTimeout{request.connectTimeout});
    }

    session.SetProgressCallback(cpr::ProgressCallback{
        [&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
            cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
            intptr_t /*userdata*/) -> bool {
            if (signal->isFired()) {
                return false;
            }

            if (request.progress) {
                try {
                    request.progress(static_cast<int64_t>(downloadNow), static_cast<int64_t>(downloadTotal));
                } catch (...) {
                    callbackError = std::current_exception();
                    return false;
                }
            }

            return true;
        }});

    if (request.sink) {
        session.SetWriteCallback(cpr::WriteCallback{
            [&](std::string_view chunk, intptr_t /*userdata*/) -> bool {
                if (signal->isFired()) {
                    return false;
                }

                try {
                    return request.sink(chunk);
                } catch (...) {
                    callbackError = std::current_exception();
                    return false;
                }
            }});
    }

    m_logger->debug("GET {} (request {})", request.url, id);

    cpr::Response response = session.Get();

    if (callbackError) {
        std::rethrow_exception(callbackError);
    }

    if (response.error) {
        if (signal->isFired()) {
            m_logger->debug("Request {} to {} was cancelled", id, request.url);
            throw RequestCancelledError();
        }

        m_logger->warn("Request {} to {} failed: {}", id, request.url, response.error.message);
        throw TransportError(response.error.message);
    }

    DownloadResponse result;
    result.statusCode = response.status_code;
    result.body = std::move(response.text);
    result.elapsed = response.elapsed;
    for (const auto& [key, value] : response.header) result.headers[key] = value;

    auto length = response.header.find("Content-Length");
    if (length != response.header.end()) {
        try {
            result.contentLength = std::stoll(length->second);
        } catch (const std::exception&) {
            m_logger->debug("Ignoring malformed Content-Length '{}'", length->second);
        }
    }

    m_logger->debug("Request {} finished with HTTP {}", id, result.statusCode);

    return DownloadResult{std::move(result), std::move(done)};
}

} // namespace stevedore::core::downloader
