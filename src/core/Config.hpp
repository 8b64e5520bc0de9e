#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace stevedore::core {

using json = nlohmann::json;

/**
 * Configuration store - thread-safe
 *
 * Manages daemon settings with:
 * - Type-safe getters with defaults
 * - Loading from a JSON file
 * - Dot-notation key paths ("downloads.timeout")
 */
class Config {
public:
    Config() {
        setDefaults();
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Reset to the default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }},
            {"operations", {
                {"retention", 5000}
            }},
            {"downloads", {
                {"timeout", 0},
                {"connectTimeout", 30000},
                {"retryCount", 3},
                {"retryDelay", 1000},
                {"userAgent", "stevedore/1.0"}
            }},
            {"streams", {
                {"readBufferSize", 32 * 1024}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.timeout")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

private:
    /**
     * Convert dot notation to JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
};

} // namespace stevedore::core
