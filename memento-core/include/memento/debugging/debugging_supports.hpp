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
#ifndef MEMENTO_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
#define MEMENTO_DEBUGGING_DEBUGGING_SUPPORTS_HPP_

#include <string>

#include "memento/fwd.hpp"
#include "memento/initializable.hpp"
#include "memento/debugging/debugging_options.hpp"

namespace memento {
namespace debugging {
/**
 * @brief APIs to support debugging functionalities.
 * @ingroup DEBUGGING
 * @details
 * This is the first module an Engine initializes and the last one it uninitializes,
 * so every other module can use glog.
 */
class DebuggingSupports final : public DefaultInitializable {
 public:
  DebuggingSupports() = delete;
  explicit DebuggingSupports(const DebuggingOptions& options) : options_(options) {}
  ErrorStack  initialize_once() override;
  ErrorStack  uninitialize_once() override;

  /** @copydoc DebuggingOptions#debug_log_to_stderr_ */
  void                set_debug_log_to_stderr(bool value);
  /** @copydoc DebuggingOptions#debug_log_stderr_threshold_ */
  void                set_debug_log_stderr_threshold(DebuggingOptions::DebugLogLevel level);
  /** @copydoc DebuggingOptions#debug_log_min_threshold_ */
  void                set_debug_log_min_threshold(DebuggingOptions::DebugLogLevel level);
  /** @copydoc DebuggingOptions#verbose_log_level_ */
  void                set_verbose_log_level(int verbose);
  /** @copydoc DebuggingOptions#verbose_modules_ */
  void                set_verbose_module(const std::string &module, int verbose);

  /** Returns the current value of glog's FLAGS_v. */
  static int          get_verbose_log_level();

 private:
  /**
   * Initialize Google-logging only once. This is called at the beginning of initialize_once()
   * so that all other initialization can use glog.
   */
  void                initialize_glog();
  /**
   * Uninitialize Google-logging only once.  This is called at the end of uninitialize_once()
   * so that all other uninitialization can use glog.
   */
  void                uninitialize_glog();

  const DebuggingOptions  options_;
};
}  // namespace debugging
}  // namespace memento
#endif  // MEMENTO_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
