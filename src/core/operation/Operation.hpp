#pragma once

/**
 * Operation.hpp
 *
 * A long-running background task with a public status: the unit every
 * asynchronous daemon request is tracked by.
 */

#include "Metadata.hpp"
#include "StatusCode.hpp"
#include "../Channel.hpp"
#include "../EventBus.hpp"
#include "../Logger.hpp"
#include "../cancel/Canceler.hpp"
#include "../stream/MessageConn.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stevedore::core::operation {

enum class OperationClass {
    Task,       // Background work
    Websocket,  // Background work with attached stream channels
    Token       // Nothing runs; exists to be cancelled or consumed
};

std::string toString(OperationClass opClass);

class Operation;

/**
 * Work of the operation. Runs on the operation's own thread; throwing
 * fails the operation, returning metadata attaches it to the result.
 */
using RunHook = std::function<std::optional<Metadata>(Operation& op)>;

/**
 * Asks the running work to stop. Throwing rejects the cancel request.
 */
using CancelHook = std::function<void(Operation& op)>;

/**
 * Attaches a stream connection presenting a secret
 */
using ConnectHook = std::function<void(Operation& op, const std::string& secret,
                                       stream::MessageConnPtr conn)>;

/**
 * Hooks and cancellation state of an operation, dropped when it finishes
 */
struct OperationTask {
    RunHook run;
    CancelHook cancel;
    ConnectHook connect;
    std::shared_ptr<cancel::Canceler> canceler;
};

struct OperationArgs {
    std::string project{"default"};
    OperationClass opClass{OperationClass::Task};
    std::string description;

    // Resource type -> resource names, e.g. {"instances", {"c1"}}
    std::map<std::string, std::vector<std::string>> resources;

    std::optional<Metadata> metadata;
    OperationTask task;
};

/**
 * Operation - status machine of one background task
 *
 * Created -> Running -> (intermediate statuses) -> exactly one of
 * Success, Failure, Cancelled. Every field is guarded by the operation
 * mutex; hooks run outside of it. Each change is published on the
 * "operation" event.
 */
class Operation : public std::enable_shared_from_this<Operation> {
public:
    using Clock = std::chrono::system_clock;

    /**
     * Create an operation in the Created status
     * @throws OperationError if the hooks do not fit the operation class
     */
    static std::shared_ptr<Operation> create(OperationArgs args,
                                             std::shared_ptr<EventBus> events = nullptr,
                                             LoggerPtr logger = nullptr);

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    /**
     * Move to Running and start the run hook on its own thread
     * @throws OperationError unless the operation is Created or Pending
     */
    void start();

    /**
     * Request cancellation. With a cancel hook or without run hook the
     * operation is Cancelled on return; otherwise the in-flight calls of
     * its Canceler are aborted and the run hook decides the outcome.
     * @throws NotCancelableError if nothing can be cancelled right now
     * @throws whatever the cancel hook threw; the status is then restored
     */
    void cancel();

    /**
     * Hand a stream connection to a running websocket operation
     * @throws OperationError for other classes or when not running
     */
    void connect(const std::string& secret, stream::MessageConnPtr conn);

    /**
     * Set the status. A final code completes the operation.
     * @throws OperationError if the operation already finished
     */
    void setStatus(StatusCode code);

    /**
     * Complete the operation: Success without error, Cancelled for a
     * cancelled request or after a cancel request, Failure otherwise.
     * Fires the completion signal.
     * @throws OperationError if the operation already completed
     */
    void setResult(std::exception_ptr error, std::optional<Metadata> metadata = std::nullopt);

    /**
     * Replace the metadata
     * @throws OperationError if the operation already finished
     */
    void updateMetadata(Metadata metadata);

    /**
     * Block until the operation completes
     */
    void wait() const;

    /**
     * @return true if the operation completed within the timeout
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    /**
     * Consistent JSON snapshot of the operation
     */
    json render() const;

    const std::string& id() const { return m_id; }
    const std::string& project() const { return m_project; }
    OperationClass opClass() const { return m_class; }

    StatusCode status() const;
    bool isFinished() const;
    bool mayCancel() const;
    std::string err() const;
    std::optional<Metadata> metadata() const;
    Clock::time_point createdAt() const { return m_createdAt; }
    Clock::time_point updatedAt() const;

    /**
     * Canceler of the task, null once finished or if it has none
     */
    std::shared_ptr<cancel::Canceler> canceler() const;

private:
    Operation(OperationArgs args, std::shared_ptr<EventBus> events, LoggerPtr logger);

    // Caller holds m_mutex
    bool mayCancelLocked() const;
    std::unique_ptr<OperationTask> setStatusLocked(StatusCode code);
    std::unique_ptr<OperationTask> completeLocked(StatusCode code, std::string message,
                                                  std::optional<Metadata> metadata);

    void finished(StatusCode code);
    void publish();

private:
    const std::string m_id;
    const std::string m_project;
    const OperationClass m_class;
    const std::string m_description;
    const std::map<std::string, std::vector<std::string>> m_resources;
    const Clock::time_point m_createdAt;

    std::shared_ptr<EventBus> m_events;
    LoggerPtr m_logger;

    mutable std::mutex m_mutex;
    Clock::time_point m_updatedAt;
    StatusCode m_status{StatusCode::Created};
    std::optional<Metadata> m_metadata;
    std::string m_err;
    std::unique_ptr<OperationTask> m_task;
    bool m_hasRun{false};
    bool m_cancelRequested{false};
    bool m_completed{false};

    Signal m_done;
};

using OperationPtr = std::shared_ptr<Operation>;

} // namespace stevedore::core::operation
