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
#include "memento/storage/local_storage_backend.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "memento/assorted/assorted_func.hpp"
#include "memento/fs/entry_file.hpp"

namespace memento {
namespace storage {

fs::FileStatus LocalStorageBackend::status(const fs::Path& path) const {
  return fs::status(path);
}

ErrorStack LocalStorageBackend::make_dirs(const fs::Path& path) {
  if (fs::is_directory(path)) {
    return kRetOk;
  }
  if (!fs::create_directories(path, false)) {
    // another process might have created it in the meantime
    if (fs::is_directory(path)) {
      return kRetOk;
    }
    LOG(ERROR) << "Failed to create directory " << path << ". err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeFsMkdirFailed, path.c_str());
  }
  return kRetOk;
}

ErrorStack LocalStorageBackend::write_file(const fs::Path& path, const std::string& data) {
  ErrorCode code = fs::write_whole_file(path, data, false);
  if (code != kErrorCodeOk) {
    return ERROR_STACK_MSG(code, path.c_str());
  }
  return kRetOk;
}

ErrorStack LocalStorageBackend::read_file(const fs::Path& path, std::string* out) const {
  ErrorCode code = fs::read_whole_file(path, out);
  if (code != kErrorCodeOk) {
    return ERROR_STACK_MSG(code, path.c_str());
  }
  return kRetOk;
}

ErrorStack LocalStorageBackend::sync_tree(const fs::Path& path) {
  if (!fs::fsync_tree(path)) {
    LOG(ERROR) << "Failed to fsync " << path << ". err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeFsSyncFailed, path.c_str());
  }
  return kRetOk;
}

ErrorStack LocalStorageBackend::publish(const fs::Path& staging, const fs::Path& published) {
  if (!fs::atomic_rename_noreplace(staging, published)) {
    int rename_errno = errno;
    std::stringstream custom_message;
    custom_message << "staging=" << staging << ", published=" << published;
    errno = rename_errno;
    if (rename_errno == EEXIST) {
      return ERROR_STACK_MSG(kErrorCodeEntryConcurrentWriteConflict, custom_message.str().c_str());
    }
    LOG(ERROR) << "Failed to rename " << custom_message.str() << ". err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeFsRenameFailed, custom_message.str().c_str());
  }
  if (durable_) {
    // the rename is a change of the parent directory.
    if (!fs::fsync(published.parent_path(), false)) {
      LOG(ERROR) << "Failed to fsync parent of " << published << ". err=" << assorted::os_error();
      return ERROR_STACK_MSG(kErrorCodeFsSyncFailed, published.c_str());
    }
  }
  return kRetOk;
}

ErrorStack LocalStorageBackend::remove_tree(const fs::Path& path) {
  if (!fs::exists(path)) {
    return kRetOk;
  }
  fs::remove_all(path);
  if (fs::exists(path)) {
    LOG(ERROR) << "Failed to remove " << path << ". err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeFsRemoveFailed, path.c_str());
  }
  return kRetOk;
}

ErrorStack LocalStorageBackend::list_children(
  const fs::Path& path,
  std::vector<fs::Path>* out) const {
  out->clear();
  fs::FileStatus st = fs::status(path);
  if (!st.exists()) {
    return kRetOk;
  } else if (!st.is_directory()) {
    return ERROR_STACK_MSG(kErrorCodeFsNotDirectory, path.c_str());
  }
  *out = path.child_paths();
  return kRetOk;
}

std::ostream& operator<<(std::ostream& o, const LocalStorageBackend& v) {
  o << "<LocalStorageBackend><durable>" << v.durable_ << "</durable></LocalStorageBackend>";
  return o;
}

}  // namespace storage
}  // namespace memento
