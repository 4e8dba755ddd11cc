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
#ifndef MEMENTO_STORAGE_STORAGE_BACKEND_HPP_
#define MEMENTO_STORAGE_STORAGE_BACKEND_HPP_

#include <string>
#include <vector>

#include "memento/error_stack.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/fs/path.hpp"

namespace memento {
namespace storage {
/**
 * @brief Interface of the storage primitives the commit protocol relies on.
 * @ingroup STORAGE
 * @details
 * All paths are absolute. Methods never throw; failures come back as ErrorStack
 * with the kErrorCodeFs* code and the errno of the failed system call.
 * Implementations must be safe to call from multiple threads as long as the
 * threads work on different paths.
 */
class StorageBackend {
 public:
  virtual ~StorageBackend() {}

  /** Short name of this backend for logging, eg "local". */
  virtual const char* get_name() const = 0;

  /** Returns the type of the given path, kFileNotFound if it doesn't exist. */
  virtual fs::FileStatus  status(const fs::Path& path) const = 0;

  /** Creates the directory and all missing parents. Succeeds if it already exists. */
  virtual ErrorStack      make_dirs(const fs::Path& path) = 0;

  /** Creates or truncates the file and writes the whole content. */
  virtual ErrorStack      write_file(const fs::Path& path, const std::string& data) = 0;

  /** Reads the whole file. */
  virtual ErrorStack      read_file(const fs::Path& path, std::string* out) const = 0;

  /** Makes every file and directory under path durable. */
  virtual ErrorStack      sync_tree(const fs::Path& path) = 0;

  /**
   * @brief Indivisibly moves staging onto published, never replacing an existing target.
   * @return kErrorCodeEntryConcurrentWriteConflict if published already exists.
   * Any other failure is kErrorCodeFsRenameFailed.
   */
  virtual ErrorStack      publish(const fs::Path& staging, const fs::Path& published) = 0;

  /** Removes path and everything below it. Succeeds if it doesn't exist. */
  virtual ErrorStack      remove_tree(const fs::Path& path) = 0;

  /** Lists direct children of a directory, sorted by name. */
  virtual ErrorStack      list_children(const fs::Path& path, std::vector<fs::Path>* out) const = 0;
};

}  // namespace storage
}  // namespace memento
#endif  // MEMENTO_STORAGE_STORAGE_BACKEND_HPP_
