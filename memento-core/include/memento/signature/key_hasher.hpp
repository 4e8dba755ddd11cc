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
#ifndef MEMENTO_SIGNATURE_KEY_HASHER_HPP_
#define MEMENTO_SIGNATURE_KEY_HASHER_HPP_

#include <string>

#include "memento/error_stack.hpp"

namespace memento {
namespace signature {
/**
 * @brief Derives the cache key from a function name and a canonical signature.
 * @ingroup SIGNATURE
 * @details
 * key = lowercase hex of SHA-512(function_name + '\\n' + canonical_signature).
 * A function name never contains '\\n', so the boundary between the two parts is unique.
 * Pure and deterministic. The digest is computed with OpenSSL's EVP interface.
 */
class KeyHasher {
 public:
  enum Constants {
    /** SHA-512 digest size in bytes. */
    kDigestBytes = 64,
    /** Length of a key in hex characters. */
    kKeyLength = kDigestBytes * 2,
  };

  KeyHasher() = delete;

  /** @return kErrorCodeHashFailed if the digest backend fails. */
  static ErrorStack compute_key(
    const std::string& function_name,
    const std::string& canonical_signature,
    std::string* key);

  /** Whether the text looks like a key: kKeyLength lowercase hex characters. */
  static bool       is_valid_key(const std::string& text);
};

}  // namespace signature
}  // namespace memento
#endif  // MEMENTO_SIGNATURE_KEY_HASHER_HPP_
