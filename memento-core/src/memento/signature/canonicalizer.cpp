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
#include "memento/signature/canonicalizer.hpp"

#include <map>
#include <ostream>
#include <string>

#include "memento/signature/arguments.hpp"
#include "memento/signature/canonical_string.hpp"
#include "memento/signature/function_signature.hpp"

namespace memento {
namespace signature {

std::string Canonicalizer::escape(const std::string& text) {
  return escape_chars(text, "=;");
}

ErrorStack Canonicalizer::bind(
  const FunctionSignature& signature,
  const Arguments& arguments,
  BoundArguments* out) {
  out->clear();
  for (const auto& given : arguments.get_values()) {
    const ParameterDecl* param = signature.find_parameter(given.first);
    if (param == nullptr) {
      return ERROR_STACK_MSG(kErrorCodeSigUnknownArgument, given.first.c_str());
    } else if (param->is_output_directory()) {
      return ERROR_STACK_MSG(kErrorCodeSigOutputDirSupplied, given.first.c_str());
    }
  }

  for (const ParameterDecl& param : signature.get_parameters()) {
    if (!param.is_input()) {
      continue;
    }
    const std::string* value = arguments.find(param.name_);
    if (value) {
      out->push_back(std::make_pair(param.name_, *value));
    } else if (param.has_default_) {
      out->push_back(std::make_pair(param.name_, param.default_value_));
    } else {
      return ERROR_STACK_MSG(kErrorCodeSigMissingArgument, param.name_.c_str());
    }
  }
  return kRetOk;
}

std::string Canonicalizer::render(
  const FunctionSignature& signature,
  const BoundArguments& bound) {
  std::string ret;
  bool first = true;
  for (const auto& pair : bound) {
    if (signature.is_excluded(pair.first)) {
      continue;
    }
    if (signature.is_excluded_if_default(pair.first)) {
      const ParameterDecl* param = signature.find_parameter(pair.first);
      if (param && param->has_default_ && param->default_value_ == pair.second) {
        continue;
      }
    }
    if (!first) {
      ret += ';';
    }
    first = false;
    ret += escape(pair.first);
    ret += '=';
    ret += escape(pair.second);
  }
  return ret;
}

ErrorStack Canonicalizer::canonicalize(
  const FunctionSignature& signature,
  const Arguments& arguments,
  std::string* out) {
  BoundArguments bound;
  CHECK_ERROR(bind(signature, arguments, &bound));
  *out = render(signature, bound);
  return kRetOk;
}

std::ostream& operator<<(std::ostream& o, const Arguments& v) {
  o << "<Arguments>";
  for (const auto& value : v.get_values()) {
    o << "<" << value.first << ">" << value.second << "</" << value.first << ">";
  }
  o << "</Arguments>";
  return o;
}

}  // namespace signature
}  // namespace memento
