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
#include "memento/entry/entry_committer.hpp"

#include <glog/logging.h>

#include <string>

#include "memento/storage/storage_backend.hpp"

namespace memento {
namespace entry {

ErrorStack EntryCommitter::prepare_staging(const EntryPaths& paths) {
  CHECK_ERROR(backend_->make_dirs(paths.get_function_dir()));
  if (backend_->status(paths.get_staging_path()).exists()) {
    // random suffix collided. never share a staging directory with someone else.
    return ERROR_STACK_MSG(kErrorCodeEntryStagingFailed, paths.get_staging_path().c_str());
  }
  CHECK_ERROR(backend_->make_dirs(paths.get_staging_path()));
  return kRetOk;
}

ErrorStack EntryCommitter::commit(
  const EntryPaths& paths,
  bool has_return_value,
  const std::string& return_blob) {
  if (has_return_value) {
    CHECK_ERROR(backend_->write_file(paths.get_staging_return_value_path(), return_blob));
  }
  // the token must be the last thing written in staging
  CHECK_ERROR(backend_->write_file(
    paths.get_staging_token_path(),
    std::string(EntryPaths::kSuccessTokenContent)));
  if (durable_) {
    CHECK_ERROR(backend_->sync_tree(paths.get_staging_path()));
  }
  CHECK_ERROR(backend_->publish(paths.get_staging_path(), paths.get_published_path()));
  return kRetOk;
}

EntryValidity EntryCommitter::read_published(
  const EntryPaths& paths,
  bool has_return_value,
  std::string* return_blob) const {
  fs::FileStatus published = backend_->status(paths.get_published_path());
  if (!published.exists()) {
    return kEntryAbsent;
  } else if (!published.is_directory()) {
    return kEntryIncomplete;
  }
  if (!backend_->status(paths.get_published_token_path()).is_regular_file()) {
    return kEntryIncomplete;
  }
  if (has_return_value) {
    fs::Path value_path = paths.get_published_return_value_path();
    if (!backend_->status(value_path).is_regular_file()) {
      LOG(WARNING) << "Entry has success token but no return value: " << paths.get_published_path();
      return kEntryCorrupt;
    }
    ErrorStack read_error = backend_->read_file(value_path, return_blob);
    if (read_error.is_error()) {
      LOG(WARNING) << "Failed to read return value of " << paths.get_published_path()
        << ": " << read_error;
      return kEntryCorrupt;
    }
  }
  return kEntryValid;
}

ErrorStack EntryCommitter::discard_published(const EntryPaths& paths) {
  return backend_->remove_tree(paths.get_published_path());
}

ErrorStack EntryCommitter::discard_staging(const EntryPaths& paths) {
  return backend_->remove_tree(paths.get_staging_path());
}

}  // namespace entry
}  // namespace memento
