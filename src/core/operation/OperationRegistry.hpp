#pragma once

/**
 * OperationRegistry.hpp
 *
 * Id -> Operation map of the daemon.
 */

#include "Operation.hpp"
#include "../Config.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace stevedore::core::operation {

/**
 * OperationRegistry - owns every known operation
 *
 * Finished operations stay visible for the retention period
 * ("operations.retention", milliseconds) and are purged lazily on
 * the next access after that.
 */
class OperationRegistry {
public:
    OperationRegistry(const Config& config,
                      std::shared_ptr<EventBus> events = nullptr,
                      LoggerPtr logger = nullptr);

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /**
     * Create and register an operation (not started)
     * @throws OperationError if the hooks do not fit the operation class
     */
    OperationPtr create(OperationArgs args);

    /**
     * @throws NotFoundError if no such operation is known
     */
    OperationPtr get(const std::string& id);

    /**
     * Snapshot of the registered operations
     */
    std::map<std::string, OperationPtr> clone();

    size_t size();

private:
    // Caller holds m_mutex
    void purgeLocked();

private:
    std::shared_ptr<EventBus> m_events;
    LoggerPtr m_logger;
    std::chrono::milliseconds m_retention;

    std::mutex m_mutex;
    std::map<std::string, OperationPtr> m_operations;
};

} // namespace stevedore::core::operation
