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
#ifndef MEMENTO_ENTRY_ENTRY_STATE_HPP_
#define MEMENTO_ENTRY_ENTRY_STATE_HPP_

#include <iosfwd>

namespace memento {
namespace entry {
/**
 * @brief Where one call is in the get-or-compute sequence.
 * @ingroup ENTRY
 * @details
 * kResolving goes to kHit or kMiss. A miss goes through kStaging, kComputing and
 * kCommitting, and ends in kHit when the entry is published or kFailed otherwise.
 */
enum EntryState {
  kResolving = 0,
  kHit,
  kMiss,
  kStaging,
  kComputing,
  kCommitting,
  kFailed,
};

/**
 * @brief What a reader found at a published path.
 * @ingroup ENTRY
 */
enum EntryValidity {
  /** Nothing is published. */
  kEntryAbsent = 0,
  /** The directory exists but has no success token. Treated as absent. */
  kEntryIncomplete,
  /** The token is there but the return value is missing or unreadable. */
  kEntryCorrupt,
  kEntryValid,
};

const char* to_string(EntryState state);
const char* to_string(EntryValidity validity);

std::ostream& operator<<(std::ostream& o, EntryState state);
std::ostream& operator<<(std::ostream& o, EntryValidity validity);

}  // namespace entry
}  // namespace memento
#endif  // MEMENTO_ENTRY_ENTRY_STATE_HPP_
