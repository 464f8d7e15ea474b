#pragma once

#include "fpservice/storage/AtomicFile.hpp"
#include "fpservice/storage/SnapshotWriteQueue.hpp"
#include "fpservice/storage/Template.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fpservice {
namespace storage {

/**
 * @brief Persistent set of enrolled templates for one user
 *
 * The in-memory list is always the latest truth. Every mutation pushes a
 * snapshot copy onto a SnapshotWriteQueue, so the durable copy lags by at
 * most the writes still queued. Snapshots are taken under the registry
 * lock; the write itself runs on the queue's worker without it.
 *
 * Thread-safe.
 */
class TemplateRegistry {
public:
    struct Options {
        std::string file_path;
        std::string name_template = "Finger %d";
        size_t write_queue_capacity = 8;
    };

    /**
     * @brief Load the user's durable state synchronously
     *
     * A missing file means no templates.
     * @throws core::FileException if an existing file cannot be read or parsed
     */
    TemplateRegistry(int32_t userId, Options options);

    /**
     * Waits for queued writes to finish
     */
    ~TemplateRegistry();

    TemplateRegistry(const TemplateRegistry&) = delete;
    TemplateRegistry& operator=(const TemplateRegistry&) = delete;

    /**
     * @brief Copy of all templates in enrollment order
     */
    std::vector<Template> list() const;

    std::optional<Template> find(int32_t templateId) const;

    size_t size() const;

    /**
     * @brief Append a template with a generated unique name
     * @throws core::FileException if an earlier durable write failed
     */
    Template add(int32_t templateId, int32_t groupId);

    /**
     * @brief Append a template, keeping name if it is non-empty and unused
     * @throws core::FileException if an earlier durable write failed
     */
    Template add(int32_t templateId, int32_t groupId, const std::string& name);

    /**
     * @brief Remove the first template with this id
     * @return false if no such template
     */
    bool remove(int32_t templateId);

    /**
     * @brief Rename a template; an empty name is ignored
     * @return true if a template was renamed
     */
    bool rename(int32_t templateId, const std::string& newName);

    /**
     * @brief Wait until every scheduled write has reached storage
     * @throws core::FileException if a durable write failed
     */
    void flush();

    bool hasPendingWrites() const;

    int32_t getUserId() const { return user_id_; }
    const std::string& getFilePath() const { return file_.getPath(); }

private:
    std::string generateUniqueNameLocked() const;
    bool isNameUniqueLocked(const std::string& name) const;
    std::string formatName(int index) const;
    void commitLocked(std::vector<Template> next);
    void writeSnapshot(const std::vector<Template>& snapshot);
    void readStateLocked();

    const int32_t user_id_;
    const Options options_;

    mutable std::mutex mutex_;
    std::vector<Template> templates_;
    AtomicFile file_;
    std::unique_ptr<SnapshotWriteQueue> writer_;
};

} // namespace storage
} // namespace fpservice
