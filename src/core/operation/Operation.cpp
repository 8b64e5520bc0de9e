/**
 * Operation.cpp
 *
 * Implementation of the operation status machine.
 */

#include "Operation.hpp"
#include "../Errors.hpp"
#include "../../utils/Crypto.hpp"
#include "../../utils/StringUtils.hpp"

#include <thread>

namespace stevedore::core::operation {

namespace {

/**
 * Message and cancellation state carried by an exception_ptr
 */
std::pair<std::string, bool> describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const RequestCancelledError& e) {
        return {e.what(), true};
    } catch (const std::exception& e) {
        return {e.what(), false};
    } catch (...) {
        return {"unknown error", false};
    }
}

} // namespace

std::string toString(OperationClass opClass) {
    switch (opClass) {
        case OperationClass::Task:      return "task";
        case OperationClass::Websocket: return "websocket";
        case OperationClass::Token:     return "token";
        default:                        return "";
    }
}

std::shared_ptr<Operation> Operation::create(OperationArgs args,
                                             std::shared_ptr<EventBus> events,
                                             LoggerPtr logger) {
    const OperationTask& task = args.task;

    if (args.opClass == OperationClass::Websocket && !task.connect) {
        throw OperationError("Websocket operations must have a connect hook");
    }

    if (args.opClass != OperationClass::Websocket && task.connect) {
        throw OperationError("Only websocket operations can have a connect hook");
    }

    if (args.opClass == OperationClass::Token && (task.run || task.cancel)) {
        throw OperationError("Token operations can't have run or cancel hooks");
    }

    std::shared_ptr<Operation> op(new Operation(std::move(args), std::move(events), std::move(logger)));

    op->m_logger->debug("New {} operation: {}", toString(op->m_class), op->m_id);
    op->publish();

    return op;
}

Operation::Operation(OperationArgs args, std::shared_ptr<EventBus> events, LoggerPtr logger)
    : m_id(utils::Crypto::generateUUID())
    , m_project(std::move(args.project))
    , m_class(args.opClass)
    , m_description(std::move(args.description))
    , m_resources(std::move(args.resources))
    , m_createdAt(Clock::now())
    , m_events(std::move(events))
    , m_logger(orNullLogger(std::move(logger)))
    , m_updatedAt(m_createdAt)
    , m_metadata(std::move(args.metadata))
    , m_task(std::make_unique<OperationTask>(std::move(args.task))) {
    m_hasRun = static_cast<bool>(m_task->run);
}

void Operation::start() {
    RunHook run;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_status != StatusCode::Created && m_status != StatusCode::Pending) {
            throw OperationError("Only pending operations can be started");
        }

        setStatusLocked(StatusCode::Running);

        if (m_task) {
            run = std::move(m_task->run);
        }
    }

    m_logger->debug("Started {} operation: {}", toString(m_class), m_id);
    publish();

    if (!run) {
        return;
    }

    std::thread([self = shared_from_this(), run = std::move(run)] {
        std::optional<Metadata> metadata;
        std::exception_ptr error;

        try {
            metadata = run(*self);
        } catch (...) {
            error = std::current_exception();
        }

        try {
            self->setResult(error, std::move(metadata));
        } catch (const OperationError& e) {
            // Already completed by a cancel request
            self->m_logger->debug("Operation {}: run result dropped: {}", self->m_id, e.what());
        }
    }).detach();
}

void Operation::cancel() {
    CancelHook hook;
    std::shared_ptr<cancel::Canceler> canceler;
    StatusCode previous;
    bool hasRun;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!mayCancelLocked()) {
            throw NotCancelableError();
        }

        previous = m_status;
        hasRun = m_hasRun;
        m_cancelRequested = true;

        if (m_task) {
            hook = m_task->cancel;
            canceler = m_task->canceler;
        }

        setStatusLocked(StatusCode::Cancelling);
    }

    m_logger->debug("Cancelling {} operation: {}", toString(m_class), m_id);
    publish();

    if (hook) {
        try {
            hook(*this);
        } catch (const std::exception& e) {
            m_logger->warn("Failed to cancel operation {}: {}", m_id, e.what());

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!isFinal(m_status)) {
                    m_cancelRequested = false;
                    setStatusLocked(previous);
                }
            }

            publish();
            throw;
        }
    }

    if (canceler && canceler->cancelable()) {
        try {
            canceler->cancel();
        } catch (const NotCancelableError&) {
            // The last in-flight call finished in the meantime
            m_logger->debug("Operation {}: nothing left to cancel", m_id);
        }
    }

    // A successful cancel hook, or the absence of any work, ends the operation here
    if (hook || !hasRun) {
        try {
            setResult(std::make_exception_ptr(RequestCancelledError()));
        } catch (const OperationError& e) {
            m_logger->debug("Operation {} already completed: {}", m_id, e.what());
        }
    }
}

void Operation::connect(const std::string& secret, stream::MessageConnPtr conn) {
    ConnectHook hook;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_class != OperationClass::Websocket) {
            throw OperationError("Only websocket operations can be connected");
        }

        if (m_status != StatusCode::Running) {
            throw OperationError("Only running operations can be connected");
        }

        if (m_task) {
            hook = m_task->connect;
        }
    }

    if (!hook) {
        throw OperationError("Operation has no connect hook");
    }

    hook(*this, secret, std::move(conn));
}

void Operation::setStatus(StatusCode code) {
    std::unique_ptr<OperationTask> task;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_completed || isFinal(m_status)) {
            throw OperationError("Operation " + m_id + " is already finished");
        }

        if (isFinal(code)) {
            task = completeLocked(code, "", std::nullopt);
        } else {
            setStatusLocked(code);
        }
    }

    task.reset();

    if (isFinal(code)) {
        finished(code);
    } else {
        publish();
    }
}

void Operation::setResult(std::exception_ptr error, std::optional<Metadata> metadata) {
    std::unique_ptr<OperationTask> task;
    StatusCode code = StatusCode::Success;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_completed) {
            throw OperationError("Operation " + m_id + " already completed");
        }

        std::string message;
        if (error) {
            auto [what, cancelled] = describe(error);
            message = std::move(what);
            code = (cancelled || m_cancelRequested) ? StatusCode::Cancelled : StatusCode::Failure;
        }

        task = completeLocked(code, std::move(message), std::move(metadata));
    }

    // Hooks and captured state are released outside of the lock
    task.reset();

    finished(code);
}

void Operation::updateMetadata(Metadata metadata) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (isFinal(m_status)) {
            throw OperationError("Operation " + m_id + " is already finished");
        }

        m_metadata = std::move(metadata);
        m_updatedAt = Clock::now();
    }

    publish();
}

void Operation::wait() const {
    m_done.wait();
}

bool Operation::waitFor(std::chrono::milliseconds timeout) const {
    return m_done.waitFor(timeout);
}

json Operation::render() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json resources = json::object();
    for (const auto& [type, names] : m_resources) {
        json urls = json::array();
        for (const auto& name : names) {
            urls.push_back("/1.0/" + type + "/" + name);
        }
        resources[type] = urls;
    }

    return json{
        {"id", m_id},
        {"class", toString(m_class)},
        {"description", m_description},
        {"created_at", utils::StringUtils::formatRfc3339(m_createdAt)},
        {"updated_at", utils::StringUtils::formatRfc3339(m_updatedAt)},
        {"status", toString(m_status)},
        {"status_code", static_cast<int>(m_status)},
        {"resources", resources},
        {"metadata", m_metadata ? renderMetadata(*m_metadata) : json(nullptr)},
        {"may_cancel", mayCancelLocked()},
        {"err", m_err}
    };
}

StatusCode Operation::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool Operation::isFinished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isFinal(m_status);
}

bool Operation::mayCancel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return mayCancelLocked();
}

std::string Operation::err() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_err;
}

std::optional<Metadata> Operation::metadata() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_metadata;
}

Operation::Clock::time_point Operation::updatedAt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_updatedAt;
}

std::shared_ptr<cancel::Canceler> Operation::canceler() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_task ? m_task->canceler : nullptr;
}

bool Operation::mayCancelLocked() const {
    if (isFinal(m_status)) {
        return false;
    }

    if (m_class == OperationClass::Token) {
        return true;
    }

    if (!m_task) {
        return false;
    }

    if (m_task->cancel) {
        return true;
    }

    return m_task->canceler && m_task->canceler->cancelable();
}

std::unique_ptr<OperationTask> Operation::setStatusLocked(StatusCode code) {
    m_status = code;
    m_updatedAt = Clock::now();

    if (isFinal(code)) {
        return std::move(m_task);
    }

    return nullptr;
}

std::unique_ptr<OperationTask> Operation::completeLocked(StatusCode code, std::string message,
                                                         std::optional<Metadata> metadata) {
    m_completed = true;
    m_err = std::move(message);

    if (metadata) {
        m_metadata = std::move(metadata);
    }

    return setStatusLocked(code);
}

void Operation::finished(StatusCode code) {
    if (code == StatusCode::Success) {
        m_logger->debug("Success for {} operation: {}", toString(m_class), m_id);
    } else {
        m_logger->debug("{} for {} operation: {}: {}", toString(code), toString(m_class), m_id, err());
    }

    publish();
    m_done.fire();
}

void Operation::publish() {
    if (!m_events) {
        return;
    }

    m_events->emit("operation", render());
}

} // namespace stevedore::core::operation
