// include/strata/file_utils.h
#pragma once

#include <string>
#include <functional>

namespace strata {

/**
 * @brief Forces the file's contents to stable storage.
 * @throws storage::StorageError(IO_FLUSH_ERROR) on failure.
 */
void SyncFile(const std::string& path);

/**
 * @brief Forces the directory entries (creations, renames) to stable storage.
 * @throws storage::StorageError(IO_FLUSH_ERROR) on failure.
 */
void SyncDirectory(const std::string& dir_path);

/**
 * @brief Replaces `path` with `contents` atomically: writes `path.tmp`, syncs it,
 *        renames it over `path` and syncs the parent directory.
 *
 * The rename is the commit point. A directory sync that fails after it is logged
 * and the call still returns normally, because `path` already holds `contents`.
 *
 * @throws storage::StorageError(IO_WRITE_ERROR / IO_FLUSH_ERROR) if the write fails
 *         before the rename; the previous file is left untouched.
 */
void AtomicWriteFile(const std::string& path, const std::string& contents);

/**
 * @brief Installs a callback that AtomicWriteFile runs after the rename, in place of
 *        the directory sync. It receives the replaced path and may throw to simulate
 *        a failed sync. An empty function restores the real sync.
 */
void SetPostRenameSyncHookForTesting(std::function<void(const std::string&)> hook);

} // namespace strata
