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
#ifndef MEMENTO_DEBUGGING_NAMESPACE_INFO_HPP_
#define MEMENTO_DEBUGGING_NAMESPACE_INFO_HPP_

/**
 * @namespace memento::debugging
 * @brief \b Debug-Logging and stop-watch utilities.
 * @details
 * @par Debug-Logging
 * We use \b glog for debug logging. It is initialized once per process by DebuggingSupports,
 * which every Engine owns, so that multiple engines in one process share the same glog.
 * Cache hits are logged with VLOG(1), misses with LOG(INFO), recovered corruptions
 * with LOG(WARNING).
 *
 * @par How to use glog
 * @code{.cpp}
 * #include <glog/logging.h>
 * LOG(INFO) << "Computing entry " << paths.get_published_path();
 * VLOG(1) << "Hit " << key;
 * @endcode
 * @see https://github.com/google/glog
 */

/**
 * @defgroup DEBUGGING Debug-Logging and Stop-watch
 * @ingroup IDIOMS
 * @copydoc memento::debugging
 */

#endif  // MEMENTO_DEBUGGING_NAMESPACE_INFO_HPP_
