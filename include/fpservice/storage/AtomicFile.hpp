#pragma once

#include <optional>
#include <string>

namespace fpservice {
namespace storage {

/**
 * @brief All-or-nothing replacement of a small durable file
 *
 * write() keeps the last published copy as "<path>.bak" while the new
 * contents are staged in "<path>.new", fsynced and renamed over <path>.
 * The backup is only deleted once the new copy is published. A backup
 * found at read() time means a write was interrupted, so the backup
 * replaces whatever is at <path>.
 */
class AtomicFile {
public:
    explicit AtomicFile(std::string path);

    const std::string& getPath() const { return path_; }
    std::string getBackupPath() const { return path_ + ".bak"; }
    std::string getStagingPath() const { return path_ + ".new"; }

    /**
     * @brief True if either the published file or its backup exists
     */
    bool exists() const;

    /**
     * @brief Read the published contents
     * @return std::nullopt when no durable copy exists
     * @throws core::FileException on I/O failure
     */
    std::optional<std::string> read() const;

    /**
     * @brief Atomically replace the file contents
     *
     * On failure the previous durable copy is restored before throwing.
     * @throws core::FileException
     */
    void write(const std::string& contents);

    /**
     * @brief Delete the file, its backup and any staging leftovers
     */
    void remove();

private:
    void restoreBackupIfPresent() const;
    void writeStaging(const std::string& contents) const;

    std::string path_;
};

} // namespace storage
} // namespace fpservice
