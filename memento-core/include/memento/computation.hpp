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
#ifndef MEMENTO_COMPUTATION_HPP_
#define MEMENTO_COMPUTATION_HPP_

#include <functional>
#include <string>

#include "memento/error_code.hpp"
#include "memento/error_stack.hpp"
#include "memento/entry/output_materializer.hpp"
#include "memento/fs/path.hpp"

namespace memento {
/**
 * @brief The wrapped computation, as the engine sees it.
 * @ingroup IDIOMS
 * @details
 * Receives the staging paths of the declared output directories and fills the encoded
 * return value. Returning an error aborts the call: nothing is published and the error goes
 * back to the caller as it is.
 */
typedef std::function< ErrorStack(const entry::OutputDirPaths& output_dirs,
                                  std::string* return_blob) > Computation;

/**
 * @brief How the caller's return type is stored.
 * @ingroup IDIOMS
 */
struct ReturnValueHandler {
  ReturnValueHandler() : has_return_value_(true) {}

  /** When false, return_value.bin is neither written nor required. */
  bool  has_return_value_;
  /**
   * Invoked with the stored bytes on a hit. An error makes the engine treat the entry as
   * corrupt: it is removed and recomputed. Empty means any bytes are accepted.
   */
  std::function< ErrorCode(const std::string& return_blob) > load_;
};

/**
 * @brief Result of one untyped call.
 * @ingroup IDIOMS
 */
struct CallResult {
  CallResult() : hit_(false) {}

  /** Encoded return value. Empty if the function has no return value. */
  std::string             return_blob_;
  /** Output directories under the published entry of the current cache root. */
  entry::OutputDirPaths   output_dirs_;
  /** Whether the entry already existed, ie the computation did not run. */
  bool                    hit_;
  std::string             key_;
  fs::Path                entry_path_;
};

}  // namespace memento
#endif  // MEMENTO_COMPUTATION_HPP_
