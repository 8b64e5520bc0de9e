/**
 * Metadata.cpp
 */

#include "Metadata.hpp"
#include "../../utils/Crypto.hpp"

namespace stevedore::core::operation {

void to_json(json& j, const ProgressMetadata& metadata) {
    j = json{{metadata.stage + "_progress", metadata.text}};
}

void to_json(json& j, const ExitStatusMetadata& metadata) {
    j = json{{"return", metadata.exitCode}};
}

void to_json(json& j, const StreamSecretsMetadata& metadata) {
    j = json{{"fds", metadata.fds}};
}

void to_json(json& j, const ErrorMetadata& metadata) {
    j = json{{"error", metadata.message}};
}

void to_json(json& j, const OpaqueMetadata& metadata) {
    json parsed = json::parse(metadata.bytes, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        j = std::move(parsed);
        return;
    }

    j = json{{"raw", utils::Crypto::base64Encode(metadata.bytes)}};
}

json renderMetadata(const Metadata& metadata) {
    return std::visit([](const auto& value) {
        json j;
        to_json(j, value);
        return j;
    }, metadata);
}

} // namespace stevedore::core::operation
