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
#ifndef MEMENTO_ENGINE_OPTIONS_HPP_
#define MEMENTO_ENGINE_OPTIONS_HPP_

#include <iosfwd>

// rather than forward declarations of option classes for each module, we include them here.
// these are anyway very small header files, and holding instances rather than pointers makes
// (de)allocation simpler.
#include "memento/error_stack.hpp"
#include "memento/debugging/debugging_options.hpp"
#include "memento/externalize/externalizable.hpp"
#include "memento/storage/storage_options.hpp"

namespace memento {
/**
 * @brief Set of option values given to the engine at start-up.
 * @ingroup IDIOMS
 * @details
 * This object is a collection of options for each module.
 * Options are set once before Engine::initialize(). Changing them while the engine runs
 * has no effect, except the logging options that DebuggingSupports exposes setters for.
 *
 * @par Saving and loading
 * Like other option classes, EngineOptions is Externalizable.
 * @code{.cpp}
 * EngineOptions options;
 * options.storage_.cache_root_ = "/data/memento";
 * CHECK_ERROR(options.save_to_file(fs::Path("/etc/memento.xml")));
 * EngineOptions loaded;
 * CHECK_ERROR(loaded.load_from_file(fs::Path("/etc/memento.xml")));
 * @endcode
 * Optional elements that are missing in the XML keep their default values.
 */
struct EngineOptions final : public virtual externalize::Externalizable {
  EngineOptions();
  EngineOptions(const EngineOptions& other);
  EngineOptions& operator=(const EngineOptions& other);

  // options for each module
  debugging::DebuggingOptions debugging_;
  storage::StorageOptions     storage_;

  EXTERNALIZABLE(EngineOptions);
};
}  // namespace memento
#endif  // MEMENTO_ENGINE_OPTIONS_HPP_
