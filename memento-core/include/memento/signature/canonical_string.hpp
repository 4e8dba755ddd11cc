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
#ifndef MEMENTO_SIGNATURE_CANONICAL_STRING_HPP_
#define MEMENTO_SIGNATURE_CANONICAL_STRING_HPP_

#include <stdint.h>

#include <string>
#include <vector>

#include "memento/assorted/assorted_func.hpp"

namespace memento {
namespace signature {
/**
 * @brief Trait that converts an argument value to its canonical text.
 * @ingroup SIGNATURE
 * @details
 * Each specialization provides
 * @code{.cpp}
 * static std::string to_string(const T& value);
 * @endcode
 * Two values that should share a cache entry must produce the same text, and two values
 * that should not must produce different texts. There is intentionally no definition for
 * the primary template, so an argument type without a specialization fails to compile.
 *
 * fs::Path has no specialization. A Path is always absolute, resolved against the current
 * directory and HOME, so its text differs between machines and working directories and a
 * copied cache root would never hit. Pass file arguments as the std::string the caller
 * wrote, e.g. "path/to/adata".
 *
 * To make your own type usable as an argument:
 * @code{.cpp}
 * namespace memento { namespace signature {
 * template <> struct CanonicalString<MyConfig> {
 *   static std::string to_string(const MyConfig& v) { return v.name_ + "/" + ...; }
 * };
 * }}
 * @endcode
 */
template <typename T>
struct CanonicalString;

/**
 * Prefixes a backslash to every occurrence of a character in specials and to the
 * backslash itself.
 */
std::string escape_chars(const std::string& text, const char* specials);

// @cond DOXYGEN_IGNORE
#define DECLARE_CANONICAL_STRING(x) template <> struct CanonicalString< x > {\
  static std::string to_string(const x & value);\
}
INSTANTIATE_ALL_TYPES(DECLARE_CANONICAL_STRING);
// @endcond

/** Verbatim. */
template <>
struct CanonicalString<const char*> {
  static std::string to_string(const char* value) { return std::string(value); }
};

/**
 * "[n:a,b,...]" where n is the number of elements. ',', '[' and ']' inside elements are
 * escaped. The count tells an empty vector "[0:]" from one empty element "[1:]".
 */
template <typename T>
struct CanonicalString< std::vector<T> > {
  static std::string to_string(const std::vector<T>& value) {
    std::string ret("[");
    ret += std::to_string(value.size());
    ret += ":";
    for (size_t i = 0; i < value.size(); ++i) {
      if (i > 0) {
        ret += ",";
      }
      ret += escape_chars(CanonicalString<T>::to_string(value[i]), ",[]");
    }
    ret += "]";
    return ret;
  }
};

/** Shorthand to convert with the trait, deducing the type. */
template <typename T>
inline std::string to_canonical_string(const T& value) {
  return CanonicalString<T>::to_string(value);
}
inline std::string to_canonical_string(const char* value) {
  return CanonicalString<const char*>::to_string(value);
}

}  // namespace signature
}  // namespace memento
#endif  // MEMENTO_SIGNATURE_CANONICAL_STRING_HPP_
