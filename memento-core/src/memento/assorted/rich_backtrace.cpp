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
#include "memento/assorted/rich_backtrace.hpp"

#include <execinfo.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "memento/assorted/assorted_func.hpp"

namespace memento {
namespace assorted {
struct BacktraceContext {
  enum Constants {
    kMaxDepth = 64,
  };
  struct GlibcBacktraceInfo {
    void*         address_;
    std::string   symbol_;
    std::string   function_;
    std::string   binary_path_;
    std::string   function_offset_;
    void parse_symbol();
  };

  void call_glibc_backtrace() {
    glibc_bt_info_.clear();
    void* addresses[kMaxDepth];
    int depth = ::backtrace(addresses, kMaxDepth);
    char** symbols = ::backtrace_symbols(addresses, depth);
    if (symbols == nullptr) {
      return;
    }
    for (int i = 1; i < depth; ++i) {  // start from 1 to skip this method (call_glibc_backtrace)
      GlibcBacktraceInfo info;
      info.address_ = addresses[i];
      info.symbol_ = symbols[i];
      info.parse_symbol();
      glibc_bt_info_.emplace_back(info);
    }
    ::free(symbols);
  }

  std::vector<std::string> get_results(uint16_t skip, bool rich);

  std::vector<GlibcBacktraceInfo> glibc_bt_info_;
};

void BacktraceContext::GlibcBacktraceInfo::parse_symbol() {
  // Case 1: /foo/hoge/test_dummy(_ZN7memento5func3Ev+0x9) [0x43e479]
  // Case 2: /foo/hoge/libmemento.so(+0x3075a5) [0x7f1b6b8b05a5]
  // Case 3: /lib64/libpthread.so.0() [0x3d1ee0ef90]
  // Case 4: /lib64/libc.so.6(abort+0x148) [0x3d1e6370f8]
  std::size_t pos = symbol_.find("(");
  std::size_t pos2 = symbol_.find(")");
  if (pos == std::string::npos || pos2 == std::string::npos || pos >= pos2) {
    return;
  }

  binary_path_ = symbol_.substr(0, pos);
  if (pos2 == pos + 1) {  // "()"
  } else if (symbol_[pos + 1] == '+') {
    function_offset_ = symbol_.substr(pos + 2, pos2 - pos - 2);
  } else {
    std::size_t plus = symbol_.find("+", pos);
    if (plus == std::string::npos || plus > pos2) {
    } else {
      std::string mangled = symbol_.substr(pos + 1, plus - pos - 1);
      function_ = demangle_type_name(mangled.c_str());
      function_offset_ = symbol_.substr(plus + 1, pos2 - plus - 1);
    }
  }
}

std::vector<std::string> BacktraceContext::get_results(uint16_t skip, bool rich) {
  std::vector<std::string> ret;
  for (uint16_t i = skip; i < glibc_bt_info_.size(); ++i) {
    const GlibcBacktraceInfo& info = glibc_bt_info_[i];
    if (!rich || info.function_.empty()) {
      ret.emplace_back(info.symbol_);
      continue;
    }
    std::stringstream str;
    str << info.binary_path_ << ": " << info.function_ << " +" << info.function_offset_
      << " [" << info.address_ << "]";
    ret.emplace_back(str.str());
  }
  return ret;
}

std::vector<std::string> get_backtrace(bool rich) {
  BacktraceContext context;
  context.call_glibc_backtrace();
  return context.get_results(1, rich);  // skip get_backtrace itself
}

}  // namespace assorted
}  // namespace memento
