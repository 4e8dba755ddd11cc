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
#ifndef MEMENTO_NAMESPACE_INFO_HPP_
#define MEMENTO_NAMESPACE_INFO_HPP_

/**
 * @namespace memento
 * @brief Root package of \b memento, a transparent disk-backed memoization engine.
 * @details
 * memento wraps a deterministic computation and stores its result under a cache root
 * so that equivalent invocations retrieve the stored result instead of recomputing it.
 *
 * @par Quick start
 * @code{.cpp}
 * memento::EngineOptions options;
 * options.storage_.cache_root_ = "/path/to/cache";
 * memento::Engine engine(options);
 * CHECK_ERROR(engine.initialize());
 * ...
 * CHECK_ERROR(engine.uninitialize());
 * @endcode
 * See memento::CachedFunction for the typed wrapper.
 */

/**
 * @defgroup IDIOMS Coding Idioms
 * @brief Error handling, initialization and other idioms used throughout the code base.
 * @details
 * Functions that might fail return memento::ErrorStack or memento::ErrorCode.
 * We do not throw exceptions.
 */

#endif  // MEMENTO_NAMESPACE_INFO_HPP_
