#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace fpservice {
namespace storage {

/**
 * @brief Metadata of one enrolled fingerprint
 *
 * The biometric data itself never leaves the daemon. template_id is
 * assigned by the daemon and unique within one user's registry; name is
 * the only field callers may change.
 */
struct Template {
    std::string name;
    int32_t group_id = 0;
    int32_t template_id = 0;
    int64_t device_id = 0;

    Template() = default;

    Template(std::string name, int32_t group_id, int32_t template_id, int64_t device_id)
        : name(std::move(name))
        , group_id(group_id)
        , template_id(template_id)
        , device_id(device_id) {}

    bool operator==(const Template& other) const {
        return name == other.name && group_id == other.group_id &&
               template_id == other.template_id && device_id == other.device_id;
    }

    bool operator!=(const Template& other) const { return !(*this == other); }
};

} // namespace storage
} // namespace fpservice
