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
#ifndef MEMENTO_ENTRY_OUTPUT_MATERIALIZER_HPP_
#define MEMENTO_ENTRY_OUTPUT_MATERIALIZER_HPP_

#include <map>
#include <string>

#include "memento/error_stack.hpp"
#include "memento/fs/path.hpp"
#include "memento/signature/fwd.hpp"
#include "memento/storage/fwd.hpp"

namespace memento {
namespace entry {
/** Output directory name to its absolute path. */
typedef std::map<std::string, fs::Path> OutputDirPaths;

/**
 * @brief Creates output directories of a staging entry and resolves them in published ones.
 * @ingroup ENTRY
 * @details
 * Output directories are entry-relative. The computation receives paths under the staging
 * directory, and callers receive paths under the published directory of the current root.
 * An absolute path is never persisted.
 */
class OutputMaterializer {
 public:
  OutputMaterializer() = delete;

  /** Creates <entry_dir>/<name>/ for each declared output directory, in declaration order. */
  static ErrorStack     materialize(
    storage::StorageBackend* backend,
    const signature::FunctionSignature& signature,
    const fs::Path& entry_dir,
    OutputDirPaths* out);

  /** Paths of the output directories in an entry directory. Doesn't touch the disk. */
  static OutputDirPaths resolve(
    const signature::FunctionSignature& signature,
    const fs::Path& entry_dir);
};

}  // namespace entry
}  // namespace memento
#endif  // MEMENTO_ENTRY_OUTPUT_MATERIALIZER_HPP_
