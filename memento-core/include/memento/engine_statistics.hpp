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
#ifndef MEMENTO_ENGINE_STATISTICS_HPP_
#define MEMENTO_ENGINE_STATISTICS_HPP_

#include <stdint.h>

#include <iosfwd>

namespace memento {
/**
 * @brief Snapshot of per-engine call counters.
 * @ingroup IDIOMS
 * @details
 * The engine keeps these in atomics. Engine::get_statistics() copies them here.
 */
struct EngineStatistics {
  EngineStatistics()
    : hits_(0), misses_(0), corrupt_recoveries_(0), conflicts_(0), computation_failures_(0) {}

  /** Calls answered from a published entry. */
  uint64_t hits_;
  /** Calls that ran the computation. */
  uint64_t misses_;
  /** Corrupt entries that were removed and recomputed. Each also counts as a miss. */
  uint64_t corrupt_recoveries_;
  /** Publishes that lost to another writer. */
  uint64_t conflicts_;
  /** Computations that returned an error. */
  uint64_t computation_failures_;

  friend std::ostream& operator<<(std::ostream& o, const EngineStatistics& v);
};
}  // namespace memento
#endif  // MEMENTO_ENGINE_STATISTICS_HPP_
