#pragma once

#include "fpservice/storage/TemplateRegistry.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fpservice {
namespace storage {

/**
 * @brief Owner of every user's TemplateRegistry
 *
 * Owned by the service composition root and handed to sessions. Each user
 * id maps to exactly one registry, created (and loaded) on first access
 * and kept for the life of the store.
 */
class TemplateRegistryStore {
public:
    struct Options {
        std::string base_directory;
        std::string file_name = "fingerprint_templates.yaml";
        std::string name_template = "Finger %d";
        size_t write_queue_capacity = 8;
    };

    explicit TemplateRegistryStore(Options options);
    ~TemplateRegistryStore();

    TemplateRegistryStore(const TemplateRegistryStore&) = delete;
    TemplateRegistryStore& operator=(const TemplateRegistryStore&) = delete;

    /**
     * @brief Registry for userId, loading it on first use
     * @throws core::FileException if the user's durable state is unreadable
     */
    std::shared_ptr<TemplateRegistry> getRegistry(int32_t userId);

    std::vector<Template> getTemplatesForUser(int32_t userId);
    Template addTemplateForUser(int32_t templateId, int32_t groupId, int32_t userId);
    bool removeTemplateForUser(int32_t templateId, int32_t userId);

    /**
     * Empty names are ignored
     */
    void renameTemplateForUser(int32_t templateId, int32_t userId, const std::string& name);

    /**
     * @brief Flush every loaded registry
     * @throws core::FileException on the first registry whose writes failed
     */
    void flushAll();

    /**
     * Path of the durable file for userId ("<base>/<userId>/<file_name>")
     */
    std::string getFileForUser(int32_t userId) const;

    size_t loadedUserCount() const;

private:
    /// One user's registry, loaded under its own lock
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<TemplateRegistry> registry;
    };

    std::shared_ptr<Slot> getSlot(int32_t userId);
    std::vector<std::shared_ptr<TemplateRegistry>> loadedRegistries() const;
    void ensureUserDirectory(int32_t userId) const;

    const Options options_;

    mutable std::mutex mutex_;
    std::map<int32_t, std::shared_ptr<Slot>> slots_;
};

} // namespace storage
} // namespace fpservice
