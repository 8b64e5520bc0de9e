/**
 * OperationRegistry.cpp
 */

#include "OperationRegistry.hpp"
#include "../Errors.hpp"

namespace stevedore::core::operation {

OperationRegistry::OperationRegistry(const Config& config,
                                     std::shared_ptr<EventBus> events,
                                     LoggerPtr logger)
    : m_events(std::move(events))
    , m_logger(orNullLogger(std::move(logger)))
    , m_retention(config.get<int>("operations.retention", 5000)) {
}

OperationPtr OperationRegistry::create(OperationArgs args) {
    auto op = Operation::create(std::move(args), m_events, m_logger);

    std::lock_guard<std::mutex> lock(m_mutex);
    purgeLocked();
    m_operations[op->id()] = op;

    return op;
}

OperationPtr OperationRegistry::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    purgeLocked();

    auto it = m_operations.find(id);
    if (it == m_operations.end()) {
        throw NotFoundError("Operation not found");
    }

    return it->second;
}

std::map<std::string, OperationPtr> OperationRegistry::clone() {
    std::lock_guard<std::mutex> lock(m_mutex);
    purgeLocked();
    return m_operations;
}

size_t OperationRegistry::size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    purgeLocked();
    return m_operations.size();
}

void OperationRegistry::purgeLocked() {
    auto now = Operation::Clock::now();

    for (auto it = m_operations.begin(); it != m_operations.end();) {
        const auto& op = it->second;

        if (op->isFinished() && now - op->updatedAt() >= m_retention) {
            m_logger->trace("Purging operation {}", op->id());
            it = m_operations.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace stevedore::core::operation
