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
#ifndef MEMENTO_STORAGE_NAMESPACE_INFO_HPP_
#define MEMENTO_STORAGE_NAMESPACE_INFO_HPP_

/**
 * @namespace memento::storage
 * @brief \b Storage primitives underneath the cache root.
 * @details
 * Everything the engine does to the disk goes through memento::storage::StorageBackend.
 * The only implementation we ship is memento::storage::LocalStorageBackend, which works on
 * a POSIX filesystem and publishes entries with renameat2(RENAME_NOREPLACE).
 *
 * @par Atomicity
 * The one primitive that has to be indivisible is publish(). A backend must either move
 * the whole staging tree onto the published path or leave both untouched, and it must
 * refuse to replace an existing published path.
 */

/**
 * @defgroup STORAGE Storage Backend
 * @copydoc memento::storage
 */

#endif  // MEMENTO_STORAGE_NAMESPACE_INFO_HPP_
