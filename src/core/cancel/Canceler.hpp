#pragma once

/**
 * Canceler.hpp
 *
 * Registry of the in-flight cancelable calls of one operation.
 */

#include "../Channel.hpp"
#include "../Logger.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace stevedore::core::cancel {

using RequestId = uint64_t;
using CancelSignal = std::shared_ptr<Signal>;

/**
 * Canceler - tracks every cancelable call currently running on behalf of
 * an operation, so that a single cancel request aborts all of them.
 *
 * Each call registers under its own request id and receives a signal; the
 * call must abort at its next I/O boundary once the signal fires.
 */
class Canceler {
public:
    explicit Canceler(LoggerPtr logger = nullptr);

    Canceler(const Canceler&) = delete;
    Canceler& operator=(const Canceler&) = delete;

    /**
     * Track a new call
     * @param id Request identity, unique among the tracked calls
     * @return Signal fired when the call must abort
     * @throws std::logic_error if the id is already tracked
     */
    CancelSignal registerRequest(RequestId id);

    /**
     * Stop tracking a call that finished normally. Its signal is left untouched.
     * @param id Request identity
     */
    void deregister(RequestId id);

    /**
     * @return true if at least one call can be cancelled
     */
    bool cancelable() const;

    /**
     * Fire the signal of every tracked call and stop tracking them
     * @throws NotCancelableError if nothing is tracked
     */
    void cancel();

    /**
     * Allocate a request id unique to this process
     */
    static RequestId nextRequestId();

private:
    LoggerPtr m_logger;
    mutable std::mutex m_mutex;
    std::unordered_map<RequestId, CancelSignal> m_requests;
};

} // namespace stevedore::core::cancel
