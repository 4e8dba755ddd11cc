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
#ifndef MEMENTO_STORAGE_LOCAL_STORAGE_BACKEND_HPP_
#define MEMENTO_STORAGE_LOCAL_STORAGE_BACKEND_HPP_

#include <iosfwd>
#include <string>
#include <vector>

#include "memento/storage/storage_backend.hpp"

namespace memento {
namespace storage {
/**
 * @brief StorageBackend on a local POSIX filesystem.
 * @ingroup STORAGE
 * @details
 * publish() is renameat2(RENAME_NOREPLACE). On filesystems that don't support the flag
 * we fall back to rename(2), which still refuses to replace a non-empty directory.
 * A published entry always contains the success token, so the fallback detects the
 * same conflicts.
 *
 * When durable, publish() also fsyncs the parent directory so that the rename itself
 * survives a power loss.
 */
class LocalStorageBackend final : public StorageBackend {
 public:
  explicit LocalStorageBackend(bool durable) : durable_(durable) {}
  LocalStorageBackend(const LocalStorageBackend&) = delete;
  LocalStorageBackend& operator=(const LocalStorageBackend&) = delete;

  const char*     get_name() const override { return "local"; }
  fs::FileStatus  status(const fs::Path& path) const override;
  ErrorStack      make_dirs(const fs::Path& path) override;
  ErrorStack      write_file(const fs::Path& path, const std::string& data) override;
  ErrorStack      read_file(const fs::Path& path, std::string* out) const override;
  ErrorStack      sync_tree(const fs::Path& path) override;
  ErrorStack      publish(const fs::Path& staging, const fs::Path& published) override;
  ErrorStack      remove_tree(const fs::Path& path) override;
  ErrorStack      list_children(const fs::Path& path, std::vector<fs::Path>* out) const override;

  bool            is_durable() const { return durable_; }

  friend std::ostream& operator<<(std::ostream& o, const LocalStorageBackend& v);

 private:
  const bool      durable_;
};

}  // namespace storage
}  // namespace memento
#endif  // MEMENTO_STORAGE_LOCAL_STORAGE_BACKEND_HPP_
