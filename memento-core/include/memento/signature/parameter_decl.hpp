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
#ifndef MEMENTO_SIGNATURE_PARAMETER_DECL_HPP_
#define MEMENTO_SIGNATURE_PARAMETER_DECL_HPP_

#include <iosfwd>
#include <string>

namespace memento {
namespace signature {
/**
 * @brief Role of a declared parameter.
 * @ingroup SIGNATURE
 */
enum ParameterRole {
  /** A value given by the caller. Part of the key unless excluded. */
  kInput = 0,
  /**
   * A directory the engine creates inside the entry and hands to the computation.
   * Never given by the caller, never part of the key.
   */
  kOutputDirectory,
};

/**
 * @brief Declaration of one parameter of a cached function.
 * @ingroup SIGNATURE
 * @details
 * The default value is kept as its canonical string, so it can be compared textually
 * with the canonical string of a bound argument.
 */
struct ParameterDecl {
  ParameterDecl() : role_(kInput), has_default_(false) {}
  ParameterDecl(const std::string& name, ParameterRole role)
    : name_(name), role_(role), has_default_(false) {}
  ParameterDecl(const std::string& name, const std::string& default_value)
    : name_(name), role_(kInput), has_default_(true), default_value_(default_value) {}

  bool is_input() const { return role_ == kInput; }
  bool is_output_directory() const { return role_ == kOutputDirectory; }

  std::string     name_;
  ParameterRole   role_;
  bool            has_default_;
  /** Canonical string of the default value. Meaningful only when has_default_. */
  std::string     default_value_;

  bool operator==(const ParameterDecl& other) const {
    return name_ == other.name_ && role_ == other.role_ && has_default_ == other.has_default_
      && (!has_default_ || default_value_ == other.default_value_);
  }
  bool operator!=(const ParameterDecl& other) const { return !operator==(other); }

  friend std::ostream& operator<<(std::ostream& o, const ParameterDecl& v);
};

}  // namespace signature
}  // namespace memento
#endif  // MEMENTO_SIGNATURE_PARAMETER_DECL_HPP_
