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
#ifndef MEMENTO_STORAGE_STORAGE_OPTIONS_HPP_
#define MEMENTO_STORAGE_STORAGE_OPTIONS_HPP_
#include <string>

#include "memento/error_stack.hpp"
#include "memento/externalize/externalizable.hpp"

namespace memento {
namespace storage {
/**
 * @brief Set of options for the cache root and the commit protocol.
 * @ingroup STORAGE
 * @details
 * This is a POD struct. Default constructor sets default values.
 */
struct StorageOptions final : public virtual externalize::Externalizable {
  StorageOptions();

  /**
   * @brief Directory under which all entries are stored.
   * @details
   * Empty by default, in which case Engine::initialize() fails with
   * kErrorCodeConfCacheRootUnset. Relative paths and '~' are resolved against the
   * current process when the engine starts.
   */
  std::string cache_root_;

  /**
   * @brief Whether to fsync the staging tree and the parent directory on publish.
   * @details
   * Default is true. Turning this off makes commits faster, but a power loss right after
   * a commit might then leave a published entry whose files are not on disk yet.
   */
  bool        durable_commit_;

  /**
   * @brief Whether to remove a published entry that lacks the success token before computing.
   * @details
   * Default is true. When false, such an entry stays and the publish of the recomputed
   * entry fails with a conflict.
   */
  bool        remove_invalid_entries_;

  EXTERNALIZABLE(StorageOptions);
};
}  // namespace storage
}  // namespace memento
#endif  // MEMENTO_STORAGE_STORAGE_OPTIONS_HPP_
