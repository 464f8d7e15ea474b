#include "fpservice/core/Configuration.hpp"
#include "fpservice/core/exception.h"

#include <sstream>

namespace fpservice {
namespace core {

bool Configuration::load(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        config_ = YAML::LoadFile(filename);
        filename_ = filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load configuration " + filename + ": " + e.what());
        return false;
    }
}

void Configuration::loadFromString(const std::string& yaml) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        config_ = YAML::Load(yaml);
        filename_.clear();
    } catch (const YAML::Exception& e) {
        FPSERVICE_THROW(ConfigException, std::string("Malformed configuration: ") + e.what());
    }
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = lookupLocked(key);
    return node && !node.IsNull();
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filename_;
}

YAML::Node Configuration::lookupLocked(const std::string& key) const {
    // const access never inserts missing children
    const YAML::Node& root = config_;
    YAML::Node current;
    current.reset(root);

    std::istringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!current || !current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(child);
    }
    return current;
}

ServiceConfig ServiceConfig::fromConfiguration(const Configuration& config) {
    ServiceConfig result;

    result.logging.level = config.get<std::string>("logging.level", result.logging.level);
    result.logging.console = config.get<bool>("logging.console", result.logging.console);
    result.logging.file = config.get<std::string>("logging.file", result.logging.file);

    result.storage.base_directory =
        config.get<std::string>("storage.base_directory", result.storage.base_directory);
    result.storage.file_name = config.get<std::string>("storage.file_name", result.storage.file_name);
    result.storage.write_queue_capacity =
        config.get<size_t>("storage.write_queue_capacity", result.storage.write_queue_capacity);
    result.storage.name_template =
        config.get<std::string>("storage.name_template", result.storage.name_template);

    result.lockout.timed_threshold =
        config.get<int>("lockout.timed_threshold", result.lockout.timed_threshold);
    result.lockout.permanent_threshold =
        config.get<int>("lockout.permanent_threshold", result.lockout.permanent_threshold);
    result.lockout.timed_duration_ms =
        config.get<int64_t>("lockout.timed_duration_ms", result.lockout.timed_duration_ms);

    result.enroll.timeout_sec = config.get<int>("enroll.timeout_sec", result.enroll.timeout_sec);

    if (!result.validate()) {
        FPSERVICE_THROW(ConfigException, "Invalid service configuration: " + result.toString());
    }
    return result;
}

bool ServiceConfig::validate() const {
    if (storage.base_directory.empty() || storage.file_name.empty()) {
        return false;
    }
    if (storage.write_queue_capacity == 0) {
        return false;
    }
    if (lockout.timed_threshold <= 0 || lockout.permanent_threshold <= lockout.timed_threshold) {
        return false;
    }
    if (lockout.timed_duration_ms < 0) {
        return false;
    }
    return enroll.timeout_sec > 0;
}

std::string ServiceConfig::toString() const {
    std::ostringstream oss;
    oss << "logging.level=" << logging.level << ", "
        << "storage.base_directory=" << storage.base_directory << ", "
        << "storage.file_name=" << storage.file_name << ", "
        << "storage.write_queue_capacity=" << storage.write_queue_capacity << ", "
        << "lockout.timed_threshold=" << lockout.timed_threshold << ", "
        << "lockout.permanent_threshold=" << lockout.permanent_threshold << ", "
        << "lockout.timed_duration_ms=" << lockout.timed_duration_ms << ", "
        << "enroll.timeout_sec=" << enroll.timeout_sec;
    return oss.str();
}

} // namespace core
} // namespace fpservice
