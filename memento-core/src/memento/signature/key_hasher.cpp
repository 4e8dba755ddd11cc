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
#include "memento/signature/key_hasher.hpp"

#include <openssl/evp.h>

#include <string>

#include "memento/assorted/assorted_func.hpp"

namespace memento {
namespace signature {

ErrorStack KeyHasher::compute_key(
  const std::string& function_name,
  const std::string& canonical_signature,
  std::string* key) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  CHECK_OUTOFMEMORY(ctx);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_sha512(), nullptr) == 1
    && EVP_DigestUpdate(ctx, function_name.data(), function_name.size()) == 1
    && EVP_DigestUpdate(ctx, "\n", 1) == 1
    && EVP_DigestUpdate(ctx, canonical_signature.data(), canonical_signature.size()) == 1
    && EVP_DigestFinal_ex(ctx, digest, &len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok || len != static_cast<unsigned int>(kDigestBytes)) {
    return ERROR_STACK_MSG(kErrorCodeHashFailed, function_name.c_str());
  }
  *key = assorted::to_lower_hex(digest, len);
  return kRetOk;
}

bool KeyHasher::is_valid_key(const std::string& text) {
  if (text.size() != kKeyLength) {
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

}  // namespace signature
}  // namespace memento
