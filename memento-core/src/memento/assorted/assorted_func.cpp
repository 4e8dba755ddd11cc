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
#include "memento/assorted/assorted_func.hpp"

#ifdef __GNUC__  // for get_pretty_type_name()
#include <cxxabi.h>
#endif  // __GNUC__
#include <stdint.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

namespace memento {
namespace assorted {

std::string os_error() {
  return os_error(errno);
}

std::string os_error(int error_number) {
  if (error_number == 0) {
    return "[No Error]";
  }
  std::stringstream str;
  str << "[Errno " << error_number << "] " << std::strerror(error_number);
  return str.str();
}

std::string get_current_executable_path() {
  char buf[1024];
  ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf));
  if (len == -1) {
    std::cerr << "Failed to get the path of current executable. error=" << os_error() << std::endl;
    return "";
  }
  return std::string(buf, len);
}

std::string to_lower_hex(const unsigned char* data, uint32_t len) {
  static const char kDigits[] = "0123456789abcdef";
  std::string ret;
  ret.reserve(len * 2U);
  for (uint32_t i = 0; i < len; ++i) {
    ret.push_back(kDigits[data[i] >> 4]);
    ret.push_back(kDigits[data[i] & 0x0F]);
  }
  return ret;
}

std::string demangle_type_name(const char* mangled_name) {
#ifdef __GNUC__
  int status;
  char* demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
  if (demangled) {
    std::string ret(demangled);
    ::free(demangled);
    return ret;
  }
#endif  // __GNUC__
  return mangled_name;
}

}  // namespace assorted
}  // namespace memento
