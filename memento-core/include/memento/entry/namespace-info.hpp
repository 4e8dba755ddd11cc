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
#ifndef MEMENTO_ENTRY_NAMESPACE_INFO_HPP_
#define MEMENTO_ENTRY_NAMESPACE_INFO_HPP_

/**
 * @namespace memento::entry
 * @brief \b Cache entries on disk and the protocol that commits them.
 * @details
 * @par Layout
 * @code
 * <cache_root>/
 *   <function_name>/
 *     <cache_key>/                     published entry
 *       success_token
 *       return_value.bin
 *       <output_dir_name>/...
 *     <cache_key>.staging_<random>/    entry being built
 * @endcode
 *
 * @par Commit protocol
 * Everything an entry holds is written under its staging directory. The success token is the
 * last file written there. When durable commit is on, the whole staging tree is fsync-ed.
 * Then one no-replace rename makes the entry visible, and the parent directory is fsync-ed.
 * A reader treats an entry as valid if and only if the published directory has the token,
 * so it never sees a half-written entry, even after a crash or a power loss.
 *
 * Staging directory names always contain ".staging_" while keys are pure hex, so a staging
 * directory leaked by a killed process never takes part in lookups.
 */

/**
 * @defgroup ENTRY Cache Entries and Atomic Commit
 * @copydoc memento::entry
 */

#endif  // MEMENTO_ENTRY_NAMESPACE_INFO_HPP_
