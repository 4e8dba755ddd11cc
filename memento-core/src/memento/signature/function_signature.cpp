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
#include "memento/signature/function_signature.hpp"

#include <algorithm>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "memento/entry/entry_paths.hpp"

namespace memento {
namespace signature {

FunctionSignature& FunctionSignature::add_input(const std::string& name) {
  parameters_.emplace_back(ParameterDecl(name, kInput));
  return *this;
}
FunctionSignature& FunctionSignature::add_input_canonical_default(
  const std::string& name,
  const std::string& canonical_default) {
  parameters_.emplace_back(ParameterDecl(name, canonical_default));
  return *this;
}
FunctionSignature& FunctionSignature::add_output_directory(const std::string& name) {
  parameters_.emplace_back(ParameterDecl(name, kOutputDirectory));
  return *this;
}
FunctionSignature& FunctionSignature::exclude(const std::string& name) {
  policy_.exclude_.push_back(name);
  return *this;
}
FunctionSignature& FunctionSignature::exclude_if_default(const std::string& name) {
  policy_.exclude_if_default_.push_back(name);
  return *this;
}

bool FunctionSignature::is_valid_function_name(const std::string& name) {
  if (name.empty() || name[0] == '.') {
    return false;
  }
  for (size_t i = 0; i < name.size(); ++i) {
    char c = name[i];
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
      || c == '_' || c == '.' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

ErrorStack FunctionSignature::validate() const {
  if (!is_valid_function_name(function_name_)) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidFunctionName, function_name_.c_str());
  }

  std::set<std::string> names;
  for (const ParameterDecl& param : parameters_) {
    if (param.name_.empty()) {
      return ERROR_STACK_MSG(kErrorCodeConfInvalidParameterName, function_name_.c_str());
    }
    if (param.is_output_directory()) {
      // it becomes a directory name in the entry, next to our own files.
      if (!is_valid_function_name(param.name_)
        || param.name_ == entry::EntryPaths::kSuccessTokenName
        || param.name_ == entry::EntryPaths::kReturnValueName) {
        return ERROR_STACK_MSG(kErrorCodeConfInvalidParameterName, param.name_.c_str());
      }
    }
    if (!names.insert(param.name_).second) {
      return ERROR_STACK_MSG(kErrorCodeConfDuplicateParameter, param.name_.c_str());
    }
  }

  for (const std::string& name : policy_.exclude_) {
    if (names.find(name) == names.end()) {
      return ERROR_STACK_MSG(kErrorCodeConfUnknownExcludeName, name.c_str());
    }
  }
  for (const std::string& name : policy_.exclude_if_default_) {
    const ParameterDecl* param = find_parameter(name);
    if (param == nullptr) {
      return ERROR_STACK_MSG(kErrorCodeConfUnknownExcludeName, name.c_str());
    }
    if (param->is_input() && !param->has_default_) {
      return ERROR_STACK_MSG(kErrorCodeConfNoDefaultValue, name.c_str());
    }
  }
  return kRetOk;
}

const ParameterDecl* FunctionSignature::find_parameter(const std::string& name) const {
  for (const ParameterDecl& param : parameters_) {
    if (param.name_ == name) {
      return &param;
    }
  }
  return nullptr;
}

bool FunctionSignature::is_excluded(const std::string& name) const {
  return std::find(policy_.exclude_.begin(), policy_.exclude_.end(), name)
    != policy_.exclude_.end();
}
bool FunctionSignature::is_excluded_if_default(const std::string& name) const {
  return std::find(policy_.exclude_if_default_.begin(), policy_.exclude_if_default_.end(), name)
    != policy_.exclude_if_default_.end();
}

bool FunctionSignature::has_output_directory(const std::string& name) const {
  const ParameterDecl* param = find_parameter(name);
  return param != nullptr && param->is_output_directory();
}

std::vector<std::string> FunctionSignature::get_output_directory_names() const {
  std::vector<std::string> ret;
  for (const ParameterDecl& param : parameters_) {
    if (param.is_output_directory()) {
      ret.push_back(param.name_);
    }
  }
  return ret;
}

bool FunctionSignature::operator==(const FunctionSignature& other) const {
  if (function_name_ != other.function_name_ || parameters_ != other.parameters_) {
    return false;
  }
  std::set<std::string> mine(policy_.exclude_.begin(), policy_.exclude_.end());
  std::set<std::string> theirs(other.policy_.exclude_.begin(), other.policy_.exclude_.end());
  if (mine != theirs) {
    return false;
  }
  mine = std::set<std::string>(
    policy_.exclude_if_default_.begin(),
    policy_.exclude_if_default_.end());
  theirs = std::set<std::string>(
    other.policy_.exclude_if_default_.begin(),
    other.policy_.exclude_if_default_.end());
  return mine == theirs;
}

std::ostream& operator<<(std::ostream& o, const ParameterDecl& v) {
  o << "<Parameter name=\"" << v.name_ << "\" role=\""
    << (v.is_output_directory() ? "output_directory" : "input") << "\"";
  if (v.has_default_) {
    o << " default=\"" << v.default_value_ << "\"";
  }
  o << " />";
  return o;
}

std::ostream& operator<<(std::ostream& o, const FunctionSignature& v) {
  o << "<FunctionSignature name=\"" << v.function_name_ << "\">";
  for (const ParameterDecl& param : v.parameters_) {
    o << param;
  }
  for (const std::string& name : v.policy_.exclude_) {
    o << "<Exclude>" << name << "</Exclude>";
  }
  for (const std::string& name : v.policy_.exclude_if_default_) {
    o << "<ExcludeIfDefault>" << name << "</ExcludeIfDefault>";
  }
  o << "</FunctionSignature>";
  return o;
}

}  // namespace signature
}  // namespace memento
