/**
 * StreamEndpoints.cpp
 *
 * Implementation of the stream secret handshake.
 */

#include "StreamEndpoints.hpp"
#include "../Errors.hpp"
#include "../../utils/Crypto.hpp"

namespace stevedore::core::stream {

StreamEndpoints::StreamEndpoints(const std::vector<std::string>& channels, LoggerPtr logger)
    : m_logger(orNullLogger(std::move(logger))) {
    for (const auto& channel : channels) {
        m_endpoints[channel] = Endpoint{utils::Crypto::randomSecret(), nullptr};
    }
}

std::vector<std::string> StreamEndpoints::commandChannels(bool interactive) {
    if (interactive) {
        return {"control", "0"};
    }
    return {"control", "0", "1", "2"};
}

std::string StreamEndpoints::connect(const std::string& secret, MessageConnPtr conn) {
    bool complete = false;
    std::string name;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_endpoints.begin();
        for (; it != m_endpoints.end(); ++it) {
            if (it->second.secret == secret) {
                break;
            }
        }

        if (secret.empty() || it == m_endpoints.end()) {
            throw PermissionDeniedError("invalid stream secret");
        }

        if (it->second.conn) {
            throw OperationError("stream channel already connected");
        }

        it->second.conn = std::move(conn);
        name = it->first;
        complete = ++m_connected == m_endpoints.size();
    }

    m_logger->debug("Stream channel {} connected", name);

    if (complete) {
        m_allConnected->fire();
    }

    return name;
}

MessageConnPtr StreamEndpoints::get(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_endpoints.find(channel);
    return it != m_endpoints.end() ? it->second.conn : nullptr;
}

bool StreamEndpoints::allConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected == m_endpoints.size();
}

void StreamEndpoints::closeAll() {
    std::vector<MessageConnPtr> conns;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [name, endpoint] : m_endpoints) {
            if (endpoint.conn) {
                conns.push_back(endpoint.conn);
            }
        }
    }

    for (const auto& conn : conns) {
        try {
            conn->close();
        } catch (const std::exception& e) {
            m_logger->debug("Closing stream channel failed: {}", e.what());
        }
    }
}

operation::StreamSecretsMetadata StreamEndpoints::metadata() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    operation::StreamSecretsMetadata metadata;
    for (const auto& [name, endpoint] : m_endpoints) {
        metadata.fds[name] = endpoint.secret;
    }
    return metadata;
}

} // namespace stevedore::core::stream
