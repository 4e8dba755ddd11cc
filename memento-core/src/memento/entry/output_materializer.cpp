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
#include "memento/entry/output_materializer.hpp"

#include <string>
#include <vector>

#include "memento/signature/function_signature.hpp"
#include "memento/storage/storage_backend.hpp"

namespace memento {
namespace entry {

ErrorStack OutputMaterializer::materialize(
  storage::StorageBackend* backend,
  const signature::FunctionSignature& signature,
  const fs::Path& entry_dir,
  OutputDirPaths* out) {
  out->clear();
  for (const std::string& name : signature.get_output_directory_names()) {
    fs::Path dir = entry_dir / name;
    CHECK_ERROR(backend->make_dirs(dir));
    (*out)[name] = dir;
  }
  return kRetOk;
}

OutputDirPaths OutputMaterializer::resolve(
  const signature::FunctionSignature& signature,
  const fs::Path& entry_dir) {
  OutputDirPaths ret;
  for (const std::string& name : signature.get_output_directory_names()) {
    ret[name] = entry_dir / name;
  }
  return ret;
}

}  // namespace entry
}  // namespace memento
