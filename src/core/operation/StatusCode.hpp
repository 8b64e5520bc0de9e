#pragma once

/**
 * StatusCode.hpp
 *
 * Task state codes shared by operations and the API layer.
 * [100,200) in progress, 200 success, [400,500) failure.
 */

#include <string>

namespace stevedore::core::operation {

enum class StatusCode : int {
    Created    = 100,
    Started    = 101,
    Running    = 103,
    Cancelling = 104,
    Pending    = 105,
    Starting   = 106,
    Stopping   = 107,
    Aborting   = 108,
    Freezing   = 109,
    Frozen     = 110,
    Thawed     = 111,

    Success    = 200,

    Failure    = 400,
    Cancelled  = 401
};

/**
 * Whether the code is a terminal state
 */
constexpr bool isFinal(StatusCode code) {
    return static_cast<int>(code) >= 200;
}

/**
 * Display string of a status code, empty for unknown codes
 */
std::string toString(StatusCode code);

} // namespace stevedore::core::operation
