// src/file_utils.cpp
#include "strata/file_utils.h"
#include "strata/storage_error/storage_error.h"
#include "strata/lsm/sstable_meta.h" // TEMP_FILE_SUFFIX
#include "strata/debug_utils.h"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>

#ifdef __linux__
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace strata {

using storage::ErrorCode;
using storage::StorageError;

namespace {

std::mutex g_post_rename_hook_mutex;
std::function<void(const std::string&)> g_post_rename_hook;

#ifdef __linux__
void syncPath(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw StorageError::ioError(ErrorCode::IO_FLUSH_ERROR, "open for fsync", path);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        throw StorageError::ioError(ErrorCode::IO_FLUSH_ERROR, "fsync", path);
    }
    ::close(fd);
}
#endif

} // namespace

void SyncFile(const std::string& path) {
#ifdef __linux__
    syncPath(path, O_RDONLY);
#else
    (void)path; // No portable fsync; the stream flush is all we get.
#endif
}

void SyncDirectory(const std::string& dir_path) {
#ifdef __linux__
    syncPath(dir_path, O_RDONLY | O_DIRECTORY);
#else
    (void)dir_path;
#endif
}

void AtomicWriteFile(const std::string& path, const std::string& contents) {
    const std::string temp_path = path + lsm::TEMP_FILE_SUFFIX;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "open temp file", temp_path);
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "write temp file", temp_path);
        }
    }

    try {
        SyncFile(temp_path);
        fs::rename(temp_path, path);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "rename temp file", path).withContext("reason", e.what());
    } catch (const StorageError&) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        throw;
    }

    std::function<void(const std::string&)> hook;
    {
        std::lock_guard<std::mutex> lock(g_post_rename_hook_mutex);
        hook = g_post_rename_hook;
    }

    // `path` now holds the new contents whether or not the directory entry is durable yet.
    try {
        if (hook) {
            hook(path);
        } else {
            fs::path parent = fs::path(path).parent_path();
            SyncDirectory(parent.empty() ? std::string(".") : parent.string());
        }
    } catch (const StorageError& e) {
        LOG_ERROR("[AtomicWriteFile] '", path, "' was replaced but its directory could not be synced: ",
                  e.toString());
    }
}

void SetPostRenameSyncHookForTesting(std::function<void(const std::string&)> hook) {
    std::lock_guard<std::mutex> lock(g_post_rename_hook_mutex);
    g_post_rename_hook = std::move(hook);
}

} // namespace strata
