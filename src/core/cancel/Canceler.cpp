/**
 * Canceler.cpp
 */

#include "Canceler.hpp"
#include "../Errors.hpp"

#include <atomic>
#include <stdexcept>
#include <string>

namespace stevedore::core::cancel {

Canceler::Canceler(LoggerPtr logger)
    : m_logger(orNullLogger(std::move(logger))) {
}

CancelSignal Canceler::registerRequest(RequestId id) {
    auto signal = std::make_shared<Signal>();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_requests.emplace(id, signal);
    if (!inserted) {
        throw std::logic_error("request " + std::to_string(id) + " is already registered");
    }

    m_logger->trace("Registered cancelable request {}", id);
    return signal;
}

void Canceler::deregister(RequestId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_requests.erase(id) > 0) {
        m_logger->trace("Deregistered request {}", id);
    }
}

bool Canceler::cancelable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_requests.empty();
}

void Canceler::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_requests.empty()) {
        throw NotCancelableError();
    }

    for (auto& [id, signal] : m_requests) {
        signal->fire();
        m_logger->debug("Cancelled request {}", id);
    }

    m_requests.clear();
}

RequestId Canceler::nextRequestId() {
    static std::atomic<RequestId> s_nextId{0};
    return ++s_nextId;
}

} // namespace stevedore::core::cancel
