/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#ifndef MEMENTO_FS_FILESYSTEM_HPP_
#define MEMENTO_FS_FILESYSTEM_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "memento/fs/path.hpp"

namespace memento {
namespace fs {
/**
 * @enum FileType
 * @brief Analogue of boost::filesystem::file_type.
 * @ingroup FILESYSTEM
 */
enum FileType {
  kStatusError = 0,
  kFileNotFound,
  kRegularFile,
  kDirectoryFile,
  kSymlinkFile,
  kTypeUnknown,
};

/**
 * @brief Analogue of boost::filesystem::file_status.
 * @ingroup FILESYSTEM
 */
struct FileStatus {
  FileStatus()            : type_(kStatusError) {}
  explicit FileStatus(FileType type) : type_(type) {}

  bool type_present() const       { return type_ != kStatusError; }
  bool exists() const             { return type_ != kStatusError && type_ != kFileNotFound; }
  bool is_regular_file() const    { return type_ == kRegularFile; }
  bool is_directory() const       { return type_ == kDirectoryFile; }
  bool is_symlink() const         { return type_ == kSymlinkFile; }

  FileType        type_;
};

/**
 * Returns the status of the file.
 * @ingroup FILESYSTEM
 */
FileStatus status(const Path& p);
/**
 * Same as status() except that a symbolic link is reported as kSymlinkFile
 * instead of the type of its target.
 * @ingroup FILESYSTEM
 */
FileStatus symlink_status(const Path& p);
/**
 * Returns if the file exists.
 * @ingroup FILESYSTEM
 */
inline bool exists(const Path& p) {return status(p).exists(); }
/**
 * Returns if the file is a directory.
 * @ingroup FILESYSTEM
 */
inline bool is_directory(const Path& p) {return status(p).is_directory(); }
/**
 * Returns if the file is a regular file.
 * @ingroup FILESYSTEM
 */
inline bool is_regular_file(const Path& p) {return status(p).is_regular_file(); }
/**
 * Returns if the file itself is a symbolic link.
 * @ingroup FILESYSTEM
 */
inline bool is_symlink(const Path& p) {return symlink_status(p).is_symlink(); }

/**
 * Returns the current working directory.
 * @ingroup FILESYSTEM
 */
Path        current_path();
/**
 * Returns the absolute path of the home directory of the user running this process.
 * @ingroup FILESYSTEM
 * @details
 * So far this checks only HOME environment variable, which might not be set in some environment.
 * In that case, this returns an empty path.
 */
Path        home_path();
/**
 * Returns the absolue path of the specified file.
 * @ingroup FILESYSTEM
 */
Path        absolute(const std::string& p);

/**
 * Recursive mkdir (mkdirs).
 * @ingroup FILESYSTEM
 * @param[in] p path of the directory to create
 * @param[in] sync (optional, default false) wheter to call fsync() on the created directories
 * and their parents. This is required to make sure the new directory entries become durable.
 * @return whether the directory already exists or creation succeeded
 */
bool        create_directories(const Path& p, bool sync = false);
/**
 * mkdir.
 * @ingroup FILESYSTEM
 * @return whether creation succeeded
 */
bool        create_directory(const Path& p, bool sync = false);
/**
 * Returns size of the file, -1 if it's not a regular file.
 * @ingroup FILESYSTEM
 */
uint64_t    file_size(const Path& p);
/**
 * Deletes a regular file, a symbolic link or an empty directory.
 * @ingroup FILESYSTEM
 * @return whether succeeded
 * @details
 * A symbolic link is unlinked. Its target is never touched.
 */
bool        remove(const Path& p);
/**
 * Recursively deletes a directory.
 * @ingroup FILESYSTEM
 * @return number of files/directories deleted.
 * @details
 * Symbolic links are never followed. Only real directories are descended into, so a link
 * pointing outside of \p p is unlinked while whatever it points to survives.
 */
uint64_t    remove_all(const Path& p);
/**
 * Equivalent to unique_name("%%%%-%%%%-%%%%-%%%%").
 * @ingroup FILESYSTEM
 */
std::string unique_name(uint64_t differentiator = 0);
/**
 * Returns a randomly generated file name with the given template.
 * @ingroup FILESYSTEM
 * @param[in] model file name template where % will be replaced with random hex numbers.
 * @param[in] differentiator Uniquefier to add to the random seed. Use this if you call
 * this method concurrently in the same process.
 */
std::string unique_name(const std::string& model, uint64_t differentiator = 0);

/**
 * @brief Makes the content and metadata of the file durable all the way up to devices.
 * @ingroup FILESYSTEM
 * @param[in] path path of the file to make durable
 * @param[in] sync_parent_directory (optional, default false) whether to also call fsync on
 * the parent directory to make sure the directory entry is written to device. This is required
 * when you create a new file, rename, etc.
 * @return whether the sync succeeded or not. If failed, check the errno global variable.
 */
bool        fsync(const Path& path, bool sync_parent_directory = false);

/**
 * @brief fsync() on every file and directory under the given path, children first.
 * @ingroup FILESYSTEM
 * @details
 * A staging cache entry is made durable with this before it is published, so that the rename
 * never exposes a directory whose files are still only in page cache.
 * Symbolic links are not followed.
 */
bool        fsync_tree(const Path& path);

/**
 * @brief Renames the old file to the new file with the POSIX atomic-rename semantics.
 * @ingroup FILESYSTEM
 * @return whether the rename succeeded
 * @details
 * When new_path already exists, this method atomically replaces it.
 * @see http://pubs.opengroup.org/onlinepubs/009695399/functions/rename.html
 */
bool        atomic_rename(const Path& old_path, const Path& new_path);

/**
 * @brief Atomically renames the old file or directory to the new path \b only \b if the new
 * path does not exist yet.
 * @ingroup FILESYSTEM
 * @return whether the rename succeeded. When it failed because new_path was already there,
 * errno is EEXIST.
 * @details
 * This uses renameat2(RENAME_NOREPLACE). On filesystems without RENAME_NOREPLACE support we
 * fall back to plain rename(), which for directories still refuses to replace a non-empty
 * target (ENOTEMPTY, which we report as EEXIST). Entries are never empty because they always
 * hold a success token, so the fallback keeps the same guarantee for our usage.
 */
bool        atomic_rename_noreplace(const Path& old_path, const Path& new_path);

/**
 * @brief fsync() on source file before rename, then fsync() on the parent folder after rename.
 * @ingroup FILESYSTEM
 * @details
 * We don't need fsync on parent directory before rename assuming old_path and new_path
 * is in the same folder.
 */
bool        durable_atomic_rename(const Path& old_path, const Path& new_path);

}  // namespace fs
}  // namespace memento
#endif  // MEMENTO_FS_FILESYSTEM_HPP_
