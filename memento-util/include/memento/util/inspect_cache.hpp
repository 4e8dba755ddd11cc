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
#ifndef MEMENTO_UTIL_INSPECT_CACHE_HPP_
#define MEMENTO_UTIL_INSPECT_CACHE_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "memento/error_stack.hpp"
#include "memento/fs/path.hpp"

namespace memento {
namespace util {

// X-Macro for CacheFinding
#define CACHE_FINDINGS \
    X(kIncompleteEntry, "A published entry without success token. Lookups ignore it, and the" \
        " engine removes it before recomputing when remove_invalid_entries_ is on.") \
    X(kLeakedStaging, "A staging directory. Left behind by a killed or running process.") \
    X(kUnknownName, "A file or directory that is neither an entry nor a staging directory.") \
    X(kNotDirectory, "A file where a function directory or an entry is expected.")

/**
 * Represents one problem found under a cache root.
 */
struct CacheFinding {
  enum FindingType {
    kNoProblem = 0,
#define X(a, b) /** b */ a,
CACHE_FINDINGS
#undef X
  };
  static const char* type_to_string(FindingType type) {
    switch (type) {
      case kNoProblem: return "kNoProblem";
#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b) case a: return X_EXPAND_AND_QUOTE(a);
CACHE_FINDINGS
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE
      default:
        return "UNKNOWN";
    }
  }
  static const char* type_to_description(FindingType type) {
    switch (type) {
      case kNoProblem: return "not a problem";
#define X(a, b) case a: return b;
CACHE_FINDINGS
#undef X
      default:
        return "UNKNOWN";
    }
  }

  CacheFinding(FindingType type = kNoProblem, const fs::Path& path = fs::Path(),
               bool removed = false) : type_(type), path_(path), removed_(removed) {}

  FindingType   type_;
  fs::Path      path_;
  /** Whether the inspector removed it. */
  bool          removed_;

  friend std::ostream& operator<<(std::ostream& o, const CacheFinding& v);
};

/**
 * Lists, verifies and cleans up entries under a cache root.
 */
struct InspectCache {
  enum Verbosity {
    kBrief = 0,
    kDetail = 1,
  };

  InspectCache() {
    verbose_ = kBrief;
    clean_staging_ = false;
    remove_invalid_ = false;
    result_functions_ = 0;
    result_valid_entries_ = 0;
  }

  fs::Path                      root_;
  /** Empty means all functions. */
  std::string                   function_;
  Verbosity                     verbose_;
  bool                          clean_staging_;
  bool                          remove_invalid_;

  uint32_t                      result_functions_;
  uint32_t                      result_valid_entries_;
  std::vector< CacheFinding >   result_findings_;

  /**
   * main routine of memento_inspect utility.
   * @return 0 if no incomplete entry remains, 1 otherwise.
   */
  int inspect_to_stdout();

  /** Walks the root and fills result_*. Writes per-entry lines to out. */
  ErrorStack inspect(std::ostream* out);

  /** Number of findings of the type that were not removed. */
  uint32_t count_remaining(CacheFinding::FindingType type) const;

 private:
  ErrorStack inspect_function(const fs::Path& function_dir, std::ostream* out);
  ErrorStack inspect_entry(const fs::Path& entry_dir, std::ostream* out);
};

}  // namespace util
}  // namespace memento
#endif  // MEMENTO_UTIL_INSPECT_CACHE_HPP_
