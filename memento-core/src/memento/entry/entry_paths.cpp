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
#include "memento/entry/entry_paths.hpp"

#include <stdint.h>

#include <atomic>
#include <ostream>
#include <string>

#include "memento/fs/filesystem.hpp"

namespace memento {
namespace entry {

const char* const EntryPaths::kSuccessTokenName = "success_token";
const char* const EntryPaths::kSuccessTokenContent = "SUCCESS\n";
const char* const EntryPaths::kReturnValueName = "return_value.bin";
const char* const EntryPaths::kStagingInfix = ".staging_";

/** Differentiates staging names generated by threads of the same process at the same time. */
std::atomic<uint64_t> staging_name_counter(0);

EntryPaths::EntryPaths(
  const fs::Path& root,
  const std::string& function_name,
  const std::string& key)
  : root_(root), function_name_(function_name), key_(key) {
  function_dir_ = root_ / function_name_;
  published_path_ = function_dir_ / key_;
  staging_path_ = function_dir_ / (key_ + kStagingInfix
    + fs::unique_name("%%%%%%%%%%%%%%%%", staging_name_counter.fetch_add(1U)));
}

bool EntryPaths::is_staging_name(const std::string& name) {
  return name.find(kStagingInfix) != std::string::npos;
}

std::ostream& operator<<(std::ostream& o, const EntryPaths& v) {
  o << "<EntryPaths>"
    << "<function_name_>" << v.function_name_ << "</function_name_>"
    << "<key_>" << v.key_ << "</key_>"
    << "<published_path_>" << v.published_path_ << "</published_path_>"
    << "<staging_path_>" << v.staging_path_ << "</staging_path_>"
    << "</EntryPaths>";
  return o;
}

}  // namespace entry
}  // namespace memento
