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
#ifndef MEMENTO_ENTRY_ENTRY_PATHS_HPP_
#define MEMENTO_ENTRY_ENTRY_PATHS_HPP_

#include <iosfwd>
#include <string>

#include "memento/fs/path.hpp"

namespace memento {
namespace entry {
/**
 * @brief Paths of one cache entry under a cache root.
 * @ingroup ENTRY
 * @details
 * The published path is <root>/<function_name>/<key>. The staging path is a sibling
 * <key>.staging_<random> in the same directory, hence on the same filesystem, so that the
 * publishing rename stays indivisible. Each EntryPaths object gets its own random suffix.
 * Nothing here is ever written into an entry, so the root can move.
 */
class EntryPaths {
 public:
  static const char* const kSuccessTokenName;
  static const char* const kSuccessTokenContent;
  static const char* const kReturnValueName;
  static const char* const kStagingInfix;

  EntryPaths(const fs::Path& root, const std::string& function_name, const std::string& key);

  const fs::Path&     get_root() const { return root_; }
  const std::string&  get_function_name() const { return function_name_; }
  const std::string&  get_key() const { return key_; }
  /** <root>/<function_name> */
  const fs::Path&     get_function_dir() const { return function_dir_; }
  const fs::Path&     get_published_path() const { return published_path_; }
  const fs::Path&     get_staging_path() const { return staging_path_; }

  fs::Path  get_published_token_path() const { return published_path_ / kSuccessTokenName; }
  fs::Path  get_published_return_value_path() const { return published_path_ / kReturnValueName; }
  fs::Path  get_staging_token_path() const { return staging_path_ / kSuccessTokenName; }
  fs::Path  get_staging_return_value_path() const { return staging_path_ / kReturnValueName; }

  /** Whether a directory name in a function directory is a staging directory. */
  static bool is_staging_name(const std::string& name);

  friend std::ostream& operator<<(std::ostream& o, const EntryPaths& v);

 private:
  fs::Path    root_;
  std::string function_name_;
  std::string key_;
  fs::Path    function_dir_;
  fs::Path    published_path_;
  fs::Path    staging_path_;
};

}  // namespace entry
}  // namespace memento
#endif  // MEMENTO_ENTRY_ENTRY_PATHS_HPP_
