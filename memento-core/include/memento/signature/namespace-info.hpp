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
#ifndef MEMENTO_SIGNATURE_NAMESPACE_INFO_HPP_
#define MEMENTO_SIGNATURE_NAMESPACE_INFO_HPP_

/**
 * @namespace memento::signature
 * @brief \b Call signatures, their canonical strings and cache keys.
 * @details
 * A call is identified by the function name and the arguments that matter for its result.
 * @par Declaring a function
 * FunctionSignature lists parameters in declaration order. Each parameter is either an input
 * (optionally with a default value) or an output directory that the engine creates for the
 * computation. The cache policy names parameters to exclude from the key entirely, and
 * parameters to exclude only while they hold their default value. The latter lets you add a
 * parameter to an existing function without invalidating the entries computed before.
 *
 * @par Canonical string
 * Canonicalizer renders the included inputs as "name=value" pairs joined with ';'.
 * Values are converted with the CanonicalString trait. The trait must be injective for the
 * cache to be correct, which is the obligation of whoever specializes it for a new type.
 *
 * @par Cache key
 * KeyHasher digests the function name and the canonical string with SHA-512 (OpenSSL EVP)
 * and renders it as 128 lowercase hex characters.
 */

/**
 * @defgroup SIGNATURE Call Signatures and Cache Keys
 * @copydoc memento::signature
 */

#endif  // MEMENTO_SIGNATURE_NAMESPACE_INFO_HPP_
