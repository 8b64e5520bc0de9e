#pragma once

/**
 * Errors.hpp
 *
 * Exception types thrown by the operation and stream core.
 */

#include <stdexcept>
#include <string>

namespace stevedore::core {

/**
 * Network or connection failure. The message is the transport's own.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A cancelable call was aborted through its cancellation signal.
 * Neither a success nor a retryable failure.
 */
class RequestCancelledError : public std::runtime_error {
public:
    RequestCancelledError()
        : std::runtime_error("request canceled") {}

    using std::runtime_error::runtime_error;
};

/**
 * Malformed or out-of-order stream message.
 */
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Contract violation on an operation: mutating a finished operation,
 * completing it twice, using a hook the operation class does not allow.
 */
class OperationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Cancellation requested while nothing can be cancelled.
 */
class NotCancelableError : public OperationError {
public:
    NotCancelableError()
        : OperationError("operation cannot be canceled at this time") {}

    using OperationError::OperationError;
};

class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PermissionDeniedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace stevedore::core
