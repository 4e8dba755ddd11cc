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
#ifndef MEMENTO_CODEC_NAMESPACE_INFO_HPP_
#define MEMENTO_CODEC_NAMESPACE_INFO_HPP_

/**
 * @namespace memento::codec
 * @brief \b Value codec that stores return values in return_value.bin.
 * @details
 * ValueCodec<T> turns a return value into bytes and back. Integers, floating points and
 * lengths are written in little-endian with fixed widths, so an entry can be read on any
 * machine the cache root is copied to. Floating points are stored bit-exact.
 *
 * @par Supported types
 * \li All integer widths, bool, float, double.
 * \li std::string.
 * \li std::vector<T> and std::map<std::string, T> of supported types.
 * \li Any memento::externalize::Externalizable, stored as its XML text.
 * \li NoReturnValue, for functions that return nothing. return_value.bin is then not written.
 *
 * To store your own type, specialize ValueTraits. A decode failure is reported as
 * kErrorCodeCodecDecodeFailed, which the engine treats as a corrupt entry.
 */

/**
 * @defgroup CODEC Value Codec
 * @copydoc memento::codec
 */

#endif  // MEMENTO_CODEC_NAMESPACE_INFO_HPP_
