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
#include "memento/storage/storage_options.hpp"

namespace memento {
namespace storage {
StorageOptions::StorageOptions() :
  cache_root_(""),
  durable_commit_(true),
  remove_invalid_entries_(true) {
}

ErrorStack StorageOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, cache_root_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, durable_commit_, true);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, remove_invalid_entries_, true);
  return kRetOk;
}

ErrorStack StorageOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the cache root and commit protocol."));
  EXTERNALIZE_SAVE_ELEMENT(element, cache_root_,
    "Directory under which all entries are stored. Must be set before the engine starts.\n"
    " Only paths relative to this root are ever persisted, so the whole directory can be"
    " copied to another machine and used from there.");
  EXTERNALIZE_SAVE_ELEMENT(element, durable_commit_,
    "Whether to fsync the staging tree and its parent directory when publishing an entry.");
  EXTERNALIZE_SAVE_ELEMENT(element, remove_invalid_entries_,
    "Whether to remove a published entry without success token before recomputing it.");
  return kRetOk;
}
}  // namespace storage
}  // namespace memento
