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
#include "memento/entry/entry_state.hpp"

#include <ostream>

namespace memento {
namespace entry {

const char* to_string(EntryState state) {
  switch (state) {
    case kResolving: return "Resolving";
    case kHit: return "Hit";
    case kMiss: return "Miss";
    case kStaging: return "Staging";
    case kComputing: return "Computing";
    case kCommitting: return "Committing";
    case kFailed: return "Failed";
  }
  return "Unknown";
}

const char* to_string(EntryValidity validity) {
  switch (validity) {
    case kEntryAbsent: return "Absent";
    case kEntryIncomplete: return "Incomplete";
    case kEntryCorrupt: return "Corrupt";
    case kEntryValid: return "Valid";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& o, EntryState state) {
  o << to_string(state);
  return o;
}
std::ostream& operator<<(std::ostream& o, EntryValidity validity) {
  o << to_string(validity);
  return o;
}

}  // namespace entry
}  // namespace memento
