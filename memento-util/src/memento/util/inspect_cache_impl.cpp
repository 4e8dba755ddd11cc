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
#include <glog/logging.h>
#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "memento/entry/entry_committer.hpp"
#include "memento/entry/entry_paths.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/signature/function_signature.hpp"
#include "memento/signature/key_hasher.hpp"
#include "memento/storage/local_storage_backend.hpp"
#include "memento/util/inspect_cache.hpp"

namespace memento {
namespace util {

int InspectCache::inspect_to_stdout() {
  // runtime arguments
  std::cout << "<InspectCache>" << std::endl
    << "<Args>" << std::endl
      << "  <root_>" << root_ << "</root_>" << std::endl
      << "  <function_>" << function_ << "</function_>" << std::endl
      << "  <verbose_>" << verbose_ << "</verbose_>" << std::endl
      << "  <clean_staging_>" << clean_staging_ << "</clean_staging_>" << std::endl
      << "  <remove_invalid_>" << remove_invalid_ << "</remove_invalid_>" << std::endl
    << "</Args>" << std::endl;

  ErrorStack error = inspect(&std::cout);
  if (error.is_error()) {
    std::cout << "<Error>" << error << "</Error>" << std::endl << "</InspectCache>" << std::endl;
    return 1;
  }

  // also write out execution summary at the end
  std::cout << "<Results>" << std::endl
    << "  <functions_>" << result_functions_ << "</functions_>" << std::endl
    << "  <valid_entries_>" << result_valid_entries_ << "</valid_entries_>" << std::endl
    << "  <findings_>" << std::endl;
  for (const CacheFinding &finding : result_findings_) {
    std::cout << "    " << finding << std::endl;
  }
  std::cout << "  </findings_>" << std::endl
    << "</Results>" << std::endl;
  std::cout << "</InspectCache>" << std::endl;

  if (count_remaining(CacheFinding::kIncompleteEntry) > 0) {
    return 1;
  }
  return 0;
}

ErrorStack InspectCache::inspect(std::ostream* out) {
  result_functions_ = 0;
  result_valid_entries_ = 0;
  result_findings_.clear();

  if (!fs::is_directory(root_)) {
    return ERROR_STACK_MSG(kErrorCodeFsNotDirectory, root_.c_str());
  }
  storage::LocalStorageBackend backend(false);
  std::vector< fs::Path > children;
  CHECK_ERROR(backend.list_children(root_, &children));
  for (const fs::Path& child : children) {
    if (!function_.empty() && child.filename() != function_) {
      continue;
    }
    if (!fs::is_directory(child)) {
      result_findings_.emplace_back(CacheFinding(CacheFinding::kNotDirectory, child));
      continue;
    }
    if (!signature::FunctionSignature::is_valid_function_name(child.filename())) {
      result_findings_.emplace_back(CacheFinding(CacheFinding::kUnknownName, child));
      continue;
    }
    ++result_functions_;
    CHECK_ERROR(inspect_function(child, out));
  }
  return kRetOk;
}

ErrorStack InspectCache::inspect_function(const fs::Path& function_dir, std::ostream* out) {
  *out << "  <Function name=\"" << function_dir.filename() << "\">" << std::endl;
  storage::LocalStorageBackend backend(false);
  std::vector< fs::Path > children;
  CHECK_ERROR(backend.list_children(function_dir, &children));
  for (const fs::Path& child : children) {
    std::string name = child.filename();
    if (entry::EntryPaths::is_staging_name(name)) {
      bool removed = false;
      if (clean_staging_) {
        CHECK_ERROR(backend.remove_tree(child));
        removed = true;
      }
      result_findings_.emplace_back(CacheFinding(CacheFinding::kLeakedStaging, child, removed));
    } else if (signature::KeyHasher::is_valid_key(name)) {
      CHECK_ERROR(inspect_entry(child, out));
    } else {
      result_findings_.emplace_back(CacheFinding(CacheFinding::kUnknownName, child));
    }
  }
  *out << "  </Function>" << std::endl;
  return kRetOk;
}

ErrorStack InspectCache::inspect_entry(const fs::Path& entry_dir, std::ostream* out) {
  storage::LocalStorageBackend backend(false);
  entry::EntryCommitter committer(&backend, false);
  entry::EntryPaths paths(root_, entry_dir.parent_path().filename(), entry_dir.filename());
  // the return type is unknown here. the token alone decides validity.
  std::string blob;
  entry::EntryValidity validity = committer.read_published(paths, false, &blob);
  if (validity == entry::kEntryValid) {
    ++result_valid_entries_;
    *out << "    <Entry key=\"" << paths.get_key() << "\" valid=\"true\"";
    if (verbose_ >= kDetail) {
      *out << ">" << std::endl;
      std::vector< fs::Path > files;
      CHECK_ERROR(backend.list_children(entry_dir, &files));
      for (const fs::Path& file : files) {
        *out << "      <File name=\"" << file.filename() << "\"";
        if (fs::is_directory(file)) {
          *out << " directory=\"true\"";
        } else {
          *out << " bytes=\"" << fs::file_size(file) << "\"";
        }
        *out << " />" << std::endl;
      }
      *out << "    </Entry>" << std::endl;
    } else {
      *out << " />" << std::endl;
    }
    return kRetOk;
  }

  CacheFinding::FindingType type = CacheFinding::kIncompleteEntry;
  if (!fs::is_directory(entry_dir)) {
    type = CacheFinding::kNotDirectory;
  }
  bool removed = false;
  if (remove_invalid_) {
    CHECK_ERROR(committer.discard_published(paths));
    removed = true;
  }
  *out << "    <Entry key=\"" << paths.get_key() << "\" valid=\"false\" removed=\""
    << removed << "\" />" << std::endl;
  result_findings_.emplace_back(CacheFinding(type, entry_dir, removed));
  return kRetOk;
}

uint32_t InspectCache::count_remaining(CacheFinding::FindingType type) const {
  uint32_t ret = 0;
  for (const CacheFinding& finding : result_findings_) {
    if (finding.type_ == type && !finding.removed_) {
      ++ret;
    }
  }
  return ret;
}

std::ostream& operator<<(std::ostream& o, const CacheFinding& v) {
  o << "<Finding type=\"" << CacheFinding::type_to_string(v.type_) << "\""
    << " path=\"" << v.path_ << "\""
    << " removed=\"" << v.removed_ << "\">"
    << CacheFinding::type_to_description(v.type_) << "</Finding>";
  return o;
}

}  // namespace util
}  // namespace memento
