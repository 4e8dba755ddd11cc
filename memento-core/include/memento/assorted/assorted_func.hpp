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
#ifndef MEMENTO_ASSORTED_ASSORTED_FUNC_HPP_
#define MEMENTO_ASSORTED_ASSORTED_FUNC_HPP_

#include <stdint.h>

#include <string>
#include <typeinfo>

namespace memento {
namespace assorted {

/**
 * Thread-safe strerror(errno). We might do some trick here for portability, too.
 * @ingroup ASSORTED
 */
std::string os_error();

/**
 * This version receives errno.
 * @ingroup ASSORTED
 */
std::string os_error(int error_number);

/**
 * Returns the full path of current executable.
 * @ingroup ASSORTED
 */
std::string get_current_executable_path();

/**
 * @brief Lowercase hexadecimal form of arbitrary bytes, two characters per byte.
 * @ingroup ASSORTED
 */
std::string to_lower_hex(const unsigned char* data, uint32_t len);

/**
 * @brief Demangle the given C++ type name \e if possible (otherwise the original string).
 * @ingroup ASSORTED
 */
std::string demangle_type_name(const char* mangled_name);

/**
 * @brief Returns the name of the C++ type as readable as possible.
 * @ingroup ASSORTED
 * @tparam T the type
 */
template <typename T>
std::string get_pretty_type_name() {
  return demangle_type_name(typeid(T).name());
}

}  // namespace assorted
}  // namespace memento

/**
 * @def INSTANTIATE_ALL_TYPES(M)
 * @ingroup ASSORTED
 * @brief A macro to explicitly instantiate the given template for all types we care.
 * @details
 * M is the macro to explicitly instantiate a template for the given type.
 * Invoke this macro in cpp, not header, otherwise you will get multiple-definition errors.
 * externalizable.cpp and value_codec.cpp use it.
 */
/**
 * @def INSTANTIATE_ALL_NUMERIC_TYPES(M)
 * @brief INSTANTIATE_ALL_TYPES minus std::string.
 * @ingroup ASSORTED
 */
/**
 * @def INSTANTIATE_ALL_INTEGER_TYPES(M)
 * @brief INSTANTIATE_ALL_NUMERIC_TYPES minus bool/double/float.
 * @ingroup ASSORTED
 */
#define INSTANTIATE_ALL_INTEGER_TYPES(M) M(int64_t);  /** NOLINT(readability/function) */\
  M(int32_t); M(int16_t); M(int8_t); M(uint64_t);  /** NOLINT(readability/function) */\
  M(uint32_t); M(uint16_t); M(uint8_t); /** NOLINT(readability/function) */

#define INSTANTIATE_ALL_NUMERIC_TYPES(M) INSTANTIATE_ALL_INTEGER_TYPES(M);\
  M(bool); M(float); M(double); /** NOLINT(readability/function) */

#define INSTANTIATE_ALL_TYPES(M) INSTANTIATE_ALL_NUMERIC_TYPES(M);\
  M(std::string);  /** NOLINT(readability/function) */

#endif  // MEMENTO_ASSORTED_ASSORTED_FUNC_HPP_
