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
#ifndef MEMENTO_FS_NAMESPACE_INFO_HPP_
#define MEMENTO_FS_NAMESPACE_INFO_HPP_

/**
 * @namespace memento::fs
 * @brief \b Filesystem wrapper, an analogue of boost::filesystem.
 * @details
 * These methods abstract accesses to filesystems like boost::filesystem.
 * We should not directly call POSIX filesystem APIs in other modules.
 * Instead, all of them should go through this package.
 *
 * @par Why this package exists
 * Our usage of filesystem is minimal: create directories, write small files, fsync,
 * and rename. We need a few things the standard library doesn't give us even in C++17,
 * namely fsync on directories and a rename that refuses to replace an existing target.
 * Hence, we do it ourselves.
 *
 * @par Class/method designs
 * Basically, we clone Boost filesystem's class/method into this package when we find a need for
 * some filesystem API access in our code. Our goal is not to duplicate all Boost filesystem
 * classes. Just add what we need.
 */

/**
 * @defgroup FILESYSTEM Filesystem wrapper
 * @ingroup IDIOMS
 * @copydoc memento::fs
 */

#endif  // MEMENTO_FS_NAMESPACE_INFO_HPP_
