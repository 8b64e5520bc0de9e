/**
 * StatusCode.cpp
 */

#include "StatusCode.hpp"

namespace stevedore::core::operation {

std::string toString(StatusCode code) {
    switch (code) {
        case StatusCode::Created:    return "Created";
        case StatusCode::Started:    return "Started";
        case StatusCode::Running:    return "Running";
        case StatusCode::Cancelling: return "Cancelling";
        case StatusCode::Pending:    return "Pending";
        case StatusCode::Starting:   return "Starting";
        case StatusCode::Stopping:   return "Stopping";
        case StatusCode::Aborting:   return "Aborting";
        case StatusCode::Freezing:   return "Freezing";
        case StatusCode::Frozen:     return "Frozen";
        case StatusCode::Thawed:     return "Thawed";
        case StatusCode::Success:    return "Success";
        case StatusCode::Failure:    return "Failure";
        case StatusCode::Cancelled:  return "Cancelled";
    }
    return "";
}

} // namespace stevedore::core::operation
