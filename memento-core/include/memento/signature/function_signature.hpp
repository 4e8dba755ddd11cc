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
#ifndef MEMENTO_SIGNATURE_FUNCTION_SIGNATURE_HPP_
#define MEMENTO_SIGNATURE_FUNCTION_SIGNATURE_HPP_

#include <iosfwd>
#include <string>
#include <vector>

#include "memento/error_stack.hpp"
#include "memento/signature/canonical_string.hpp"
#include "memento/signature/parameter_decl.hpp"

namespace memento {
namespace signature {
/**
 * @brief Parameter filtering rules given when a function is registered.
 * @ingroup SIGNATURE
 */
struct CachePolicy {
  /** Parameters that never contribute to the key. */
  std::vector<std::string>  exclude_;
  /** Parameters that contribute to the key only when their value differs from the default. */
  std::vector<std::string>  exclude_if_default_;
};

/**
 * @brief Name, ordered parameters and cache policy of a cached function.
 * @ingroup SIGNATURE
 * @details
 * Build it with the chaining adders, then let the engine validate it on registration:
 * @code{.cpp}
 * signature::FunctionSignature sig("train");
 * sig.add_input("adata_path").add_input("n_hidden", 128).add_output_directory("output_model_dir");
 * sig.exclude("verbose");
 * @endcode
 * Nothing is checked while building. validate() reports every rule in one place so that
 * a broken declaration fails at registration time, before any call.
 */
class FunctionSignature {
 public:
  FunctionSignature() {}
  explicit FunctionSignature(const std::string& function_name) : function_name_(function_name) {}

  /** Declares an input without default value. */
  FunctionSignature&  add_input(const std::string& name);
  /** Declares an input whose default is given as an already canonical string. */
  FunctionSignature&  add_input_canonical_default(
    const std::string& name,
    const std::string& canonical_default);
  /** Declares an input with a default value. */
  template <typename T>
  FunctionSignature&  add_input(const std::string& name, const T& default_value) {
    return add_input_canonical_default(name, to_canonical_string(default_value));
  }
  FunctionSignature&  add_input(const std::string& name, const char* default_value) {
    return add_input_canonical_default(name, to_canonical_string(default_value));
  }
  /** Declares an output directory. */
  FunctionSignature&  add_output_directory(const std::string& name);

  FunctionSignature&  exclude(const std::string& name);
  FunctionSignature&  exclude_if_default(const std::string& name);

  /**
   * @brief Checks the declaration.
   * @return kErrorCodeConfInvalidFunctionName, kErrorCodeConfInvalidParameterName,
   * kErrorCodeConfDuplicateParameter, kErrorCodeConfUnknownExcludeName or
   * kErrorCodeConfNoDefaultValue.
   */
  ErrorStack          validate() const;

  const std::string&                  get_function_name() const { return function_name_; }
  const std::vector<ParameterDecl>&   get_parameters() const { return parameters_; }
  const CachePolicy&                  get_policy() const { return policy_; }

  /** Returns nullptr if there is no such parameter. */
  const ParameterDecl*  find_parameter(const std::string& name) const;
  bool                  is_excluded(const std::string& name) const;
  bool                  is_excluded_if_default(const std::string& name) const;
  /** Whether the function has an output directory of this name. */
  bool                  has_output_directory(const std::string& name) const;
  std::vector<std::string> get_output_directory_names() const;

  /**
   * Whether the name can be a directory name directly under the cache root.
   * Non-empty, only [A-Za-z0-9_.-], and not starting with '.'.
   */
  static bool           is_valid_function_name(const std::string& name);

  /**
   * Same name, same parameters in the same order with the same defaults, and the same
   * exclusion rules. The order of exclude() calls doesn't matter.
   */
  bool operator==(const FunctionSignature& other) const;
  bool operator!=(const FunctionSignature& other) const { return !operator==(other); }

  friend std::ostream& operator<<(std::ostream& o, const FunctionSignature& v);

 private:
  std::string                 function_name_;
  std::vector<ParameterDecl>  parameters_;
  CachePolicy                 policy_;
};

}  // namespace signature
}  // namespace memento
#endif  // MEMENTO_SIGNATURE_FUNCTION_SIGNATURE_HPP_
