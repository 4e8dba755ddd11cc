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
#ifndef MEMENTO_ENTRY_ENTRY_COMMITTER_HPP_
#define MEMENTO_ENTRY_ENTRY_COMMITTER_HPP_

#include <string>

#include "memento/error_stack.hpp"
#include "memento/entry/entry_paths.hpp"
#include "memento/entry/entry_state.hpp"
#include "memento/storage/fwd.hpp"

namespace memento {
namespace entry {
/**
 * @brief Writes, publishes, reads and discards entries through a StorageBackend.
 * @ingroup ENTRY
 * @details
 * This object holds no state other than the backend and the durability setting,
 * so one instance serves all calls of an engine.
 */
class EntryCommitter {
 public:
  EntryCommitter(storage::StorageBackend* backend, bool durable)
    : backend_(backend), durable_(durable) {}

  /** Creates the function directory and the staging directory. */
  ErrorStack    prepare_staging(const EntryPaths& paths);

  /**
   * @brief Completes the staging entry and publishes it.
   * @details
   * Writes return_value.bin if has_return_value, then the success token. If durable, fsyncs
   * the staging tree. Then renames staging onto the published path without replacing it.
   * On failure the staging directory is left for the caller to discard.
   * @return kErrorCodeEntryConcurrentWriteConflict if someone else published first.
   */
  ErrorStack    commit(
    const EntryPaths& paths,
    bool has_return_value,
    const std::string& return_blob);

  /**
   * @brief Reads the published entry.
   * @details
   * return_blob is filled only when the result is kEntryValid and has_return_value.
   * Filesystem errors while reading the return value count as kEntryCorrupt, not as errors.
   */
  EntryValidity read_published(
    const EntryPaths& paths,
    bool has_return_value,
    std::string* return_blob) const;

  /** Removes the published entry. */
  ErrorStack    discard_published(const EntryPaths& paths);
  /** Removes the staging entry. */
  ErrorStack    discard_staging(const EntryPaths& paths);

  bool          is_durable() const { return durable_; }

 private:
  storage::StorageBackend* const  backend_;
  const bool                      durable_;
};

}  // namespace entry
}  // namespace memento
#endif  // MEMENTO_ENTRY_ENTRY_COMMITTER_HPP_
