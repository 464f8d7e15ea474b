#include "fpservice/storage/AtomicFile.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fpservice {
namespace storage {

namespace {

bool pathExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

std::string errnoMessage(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

} // namespace

AtomicFile::AtomicFile(std::string path)
    : path_(std::move(path)) {
}

bool AtomicFile::exists() const {
    return pathExists(path_) || pathExists(getBackupPath());
}

void AtomicFile::restoreBackupIfPresent() const {
    const std::string backup = getBackupPath();
    if (!pathExists(backup)) {
        return;
    }
    LOG_WARNING("Restoring interrupted write from backup " + backup);
    if (::rename(backup.c_str(), path_.c_str()) != 0) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             errnoMessage("Failed to restore backup", backup));
    }
}

std::optional<std::string> AtomicFile::read() const {
    restoreBackupIfPresent();

    if (!pathExists(path_)) {
        return std::nullopt;
    }

    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             errnoMessage("Failed to open", path_));
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             "Failed to read " + path_);
    }
    return contents.str();
}

void AtomicFile::writeStaging(const std::string& contents) const {
    const std::string staging = getStagingPath();

    int fd = ::open(staging.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             errnoMessage("Failed to create", staging));
    }

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string message = errnoMessage("Failed to write", staging);
            ::close(fd);
            FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO, message);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        std::string message = errnoMessage("Failed to sync", staging);
        ::close(fd);
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO, message);
    }
    if (::close(fd) != 0) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             errnoMessage("Failed to close", staging));
    }
}

void AtomicFile::write(const std::string& contents) {
    const std::string backup = getBackupPath();
    const std::string staging = getStagingPath();

    // A present backup is the last good copy; the published file is suspect
    if (pathExists(path_)) {
        if (!pathExists(backup)) {
            if (::rename(path_.c_str(), backup.c_str()) != 0) {
                FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                                     errnoMessage("Failed to back up", path_));
            }
        } else if (::unlink(path_.c_str()) != 0) {
            FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                                 errnoMessage("Failed to discard", path_));
        }
    }

    try {
        writeStaging(contents);
        if (::rename(staging.c_str(), path_.c_str()) != 0) {
            FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                                 errnoMessage("Failed to publish", staging));
        }
    } catch (const core::FileException& e) {
        LOG_CRITICAL("Atomic write of " + path_ + " failed, restoring backup: " + e.getMessage());
        ::unlink(staging.c_str());
        if (pathExists(backup) && ::rename(backup.c_str(), path_.c_str()) != 0) {
            LOG_CRITICAL(errnoMessage("Failed to restore backup", backup));
        }
        throw;
    }

    if (pathExists(backup) && ::unlink(backup.c_str()) != 0) {
        LOG_WARNING(errnoMessage("Failed to delete backup", backup));
    }
}

void AtomicFile::remove() {
    ::unlink(path_.c_str());
    ::unlink(getBackupPath().c_str());
    ::unlink(getStagingPath().c_str());
}

} // namespace storage
} // namespace fpservice
