#pragma once

/**
 * Metadata.hpp
 *
 * Task-specific payloads an operation exposes to pollers.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace stevedore::core::operation {

using json = nlohmann::json;

/**
 * Progress of a long transfer, e.g. "45% (1.2 MB/s)"
 */
struct ProgressMetadata {
    std::string stage{"download"};
    std::string text;
};

/**
 * Exit code of a command run inside an instance
 */
struct ExitStatusMetadata {
    int exitCode{0};
};

/**
 * One-time secrets of the stream channels of a websocket operation,
 * keyed by channel name ("control", "0", "1", "2")
 */
struct StreamSecretsMetadata {
    std::map<std::string, std::string> fds;
};

struct ErrorMetadata {
    std::string message;
};

/**
 * Payload of a shape this daemon does not know. Rendered as-is when it
 * holds a JSON document, base64-encoded otherwise.
 */
struct OpaqueMetadata {
    std::string bytes;
};

using Metadata = std::variant<
    ProgressMetadata,
    ExitStatusMetadata,
    StreamSecretsMetadata,
    ErrorMetadata,
    OpaqueMetadata
>;

void to_json(json& j, const ProgressMetadata& metadata);
void to_json(json& j, const ExitStatusMetadata& metadata);
void to_json(json& j, const StreamSecretsMetadata& metadata);
void to_json(json& j, const ErrorMetadata& metadata);
void to_json(json& j, const OpaqueMetadata& metadata);

/**
 * Render any metadata shape as the JSON object found in the API
 */
json renderMetadata(const Metadata& metadata);

} // namespace stevedore::core::operation
