#pragma once

#include "fpservice/core/Logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace fpservice {
namespace core {

/**
 * YAML backed configuration document
 *
 * Keys are dot separated paths into nested maps, e.g. "lockout.timed_threshold".
 */
class Configuration {
public:
    Configuration() = default;

    /**
     * Load configuration from a YAML file
     * @return false if the file is missing or not valid YAML
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from YAML text
     * @throws ConfigException on malformed YAML
     */
    void loadFromString(const std::string& yaml);

    bool has(const std::string& key) const;

    /**
     * Get value, or defaultValue when the key is absent or not convertible
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookupLocked(key);
        if (!node || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            LOG_WARNING("Configuration key '" + key + "' has wrong type, using default: " + e.what());
            return defaultValue;
        }
    }

    std::string getFilename() const;

private:
    YAML::Node lookupLocked(const std::string& key) const;

    mutable std::mutex mutex_;
    YAML::Node config_;
    std::string filename_;
};

/**
 * Typed service settings read from a Configuration
 */
struct ServiceConfig {
    struct LoggingConfig {
        std::string level = "INFO";
        bool console = true;
        std::string file;
    };

    struct StorageConfig {
        std::string base_directory = "/data/system/users";
        std::string file_name = "fingerprint_templates.yaml";
        size_t write_queue_capacity = 8;
        std::string name_template = "Finger %d";
    };

    struct LockoutConfig {
        int timed_threshold = 5;
        int permanent_threshold = 20;
        int64_t timed_duration_ms = 30000;
    };

    struct EnrollConfig {
        int timeout_sec = 60;
    };

    LoggingConfig logging;
    StorageConfig storage;
    LockoutConfig lockout;
    EnrollConfig enroll;

    /**
     * Build from a configuration document, keeping defaults for absent keys
     * @throws ConfigException if the resulting settings fail validate()
     */
    static ServiceConfig fromConfiguration(const Configuration& config);

    bool validate() const;
    std::string toString() const;
};

} // namespace core
} // namespace fpservice
