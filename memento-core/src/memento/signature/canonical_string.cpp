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
#include "memento/signature/canonical_string.hpp"

#include <cstdio>
#include <cstring>
#include <string>

namespace memento {
namespace signature {

std::string escape_chars(const std::string& text, const char* specials) {
  std::string ret;
  ret.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\\' || std::strchr(specials, c) != nullptr) {
      ret += '\\';
    }
    ret += c;
  }
  return ret;
}

// @cond DOXYGEN_IGNORE
#define DEFINE_INTEGER_CANONICAL_STRING(x) std::string CanonicalString< x >::to_string(\
  const x & value) { return std::to_string(value); }
INSTANTIATE_ALL_INTEGER_TYPES(DEFINE_INTEGER_CANONICAL_STRING);
// @endcond

std::string CanonicalString<bool>::to_string(const bool& value) {
  return value ? "true" : "false";
}

// 9 and 17 significant digits are enough to round-trip any float and double.
std::string CanonicalString<float>::to_string(const float& value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.9g", static_cast<double>(value));
  return std::string(buffer);
}

std::string CanonicalString<double>::to_string(const double& value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return std::string(buffer);
}

std::string CanonicalString<std::string>::to_string(const std::string& value) {
  return value;
}

}  // namespace signature
}  // namespace memento
