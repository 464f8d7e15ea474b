#include "fpservice/storage/TemplateRegistryStore.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fpservice {
namespace storage {

TemplateRegistryStore::TemplateRegistryStore(Options options)
    : options_(std::move(options)) {
    if (options_.base_directory.empty() || options_.file_name.empty()) {
        FPSERVICE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                             "Template store needs a base directory and file name");
    }
    LOG_INFO("TemplateRegistryStore rooted at " + options_.base_directory);
}

TemplateRegistryStore::~TemplateRegistryStore() = default;

std::string TemplateRegistryStore::getFileForUser(int32_t userId) const {
    return (fs::path(options_.base_directory) / std::to_string(userId) / options_.file_name).string();
}

void TemplateRegistryStore::ensureUserDirectory(int32_t userId) const {
    fs::path dir = fs::path(options_.base_directory) / std::to_string(userId);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             "Failed to create " + dir.string() + ": " + ec.message());
    }
}

std::shared_ptr<TemplateRegistryStore::Slot> TemplateRegistryStore::getSlot(int32_t userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<Slot>& slot = slots_[userId];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::shared_ptr<TemplateRegistry> TemplateRegistryStore::getRegistry(int32_t userId) {
    std::shared_ptr<Slot> slot = getSlot(userId);

    // Only callers for the same user wait on this load
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->registry) {
        return slot->registry;
    }

    ensureUserDirectory(userId);

    TemplateRegistry::Options registryOptions;
    registryOptions.file_path = getFileForUser(userId);
    registryOptions.name_template = options_.name_template;
    registryOptions.write_queue_capacity = options_.write_queue_capacity;

    slot->registry = std::make_shared<TemplateRegistry>(userId, std::move(registryOptions));
    return slot->registry;
}

std::vector<Template> TemplateRegistryStore::getTemplatesForUser(int32_t userId) {
    return getRegistry(userId)->list();
}

Template TemplateRegistryStore::addTemplateForUser(int32_t templateId, int32_t groupId, int32_t userId) {
    return getRegistry(userId)->add(templateId, groupId);
}

bool TemplateRegistryStore::removeTemplateForUser(int32_t templateId, int32_t userId) {
    return getRegistry(userId)->remove(templateId);
}

void TemplateRegistryStore::renameTemplateForUser(int32_t templateId, int32_t userId,
                                                  const std::string& name) {
    if (name.empty()) {
        return;
    }
    getRegistry(userId)->rename(templateId, name);
}

std::vector<std::shared_ptr<TemplateRegistry>> TemplateRegistryStore::loadedRegistries() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : slots_) {
            slots.push_back(entry.second);
        }
    }

    std::vector<std::shared_ptr<TemplateRegistry>> loaded;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->registry) {
            loaded.push_back(slot->registry);
        }
    }
    return loaded;
}

void TemplateRegistryStore::flushAll() {
    for (const auto& registry : loadedRegistries()) {
        registry->flush();
    }
}

size_t TemplateRegistryStore::loadedUserCount() const {
    return loadedRegistries().size();
}

} // namespace storage
} // namespace fpservice
