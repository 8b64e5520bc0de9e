#pragma once

/**
 * Channel.hpp
 *
 * Inter-thread hand-off primitives used by the pumps and the operation
 * lifecycle: a closable queue and a one-shot signal.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace stevedore::core {

/**
 * Thrown when sending on a closed channel.
 */
class ChannelClosed : public std::logic_error {
public:
    ChannelClosed()
        : std::logic_error("send on closed channel") {}
};

/**
 * Channel - closable FIFO queue shared between a producer and a consumer
 *
 * A capacity of 0 means unbounded. Receivers drain queued items before
 * observing the close.
 */
template<typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 1)
        : m_capacity(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * Queue an item, blocking while the channel is full
     * @throws ChannelClosed if the channel was closed
     */
    void send(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] {
            return m_closed || m_capacity == 0 || m_items.size() < m_capacity;
        });

        if (m_closed) {
            throw ChannelClosed();
        }

        m_items.push_back(std::move(item));
        m_notEmpty.notify_one();
    }

    /**
     * Take the next item, blocking until one is available
     * @return Item, or nullopt once the channel is closed and drained
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] {
            return m_closed || !m_items.empty();
        });

        if (m_items.empty()) {
            return std::nullopt;
        }

        T item = std::move(m_items.front());
        m_items.pop_front();
        m_notFull.notify_one();
        return item;
    }

    /**
     * Close the channel. Blocked senders fail, receivers drain and stop.
     * @return true if this call closed it
     */
    bool close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }

        m_closed = true;
        m_notEmpty.notify_all();
        m_notFull.notify_all();
        return true;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    size_t m_capacity;
    std::deque<T> m_items;
    bool m_closed{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
};

/**
 * Signal - one-shot event
 *
 * Fired at most once; every waiter observes it. Firing twice is a
 * contract violation.
 */
class Signal {
public:
    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /**
     * Fire the signal
     * @throws std::logic_error if it already fired
     */
    void fire() {
        if (!tryFire()) {
            throw std::logic_error("signal already fired");
        }
    }

    /**
     * Fire the signal unless it already fired
     * @return true if this call fired it
     */
    bool tryFire() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fired) {
            return false;
        }

        m_fired = true;
        m_condition.notify_all();
        return true;
    }

    bool isFired() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fired;
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return m_fired; });
    }

    /**
     * Wait with a timeout
     * @return true if the signal fired within the timeout
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, timeout, [this] { return m_fired; });
    }

private:
    bool m_fired{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
};

} // namespace stevedore::core
