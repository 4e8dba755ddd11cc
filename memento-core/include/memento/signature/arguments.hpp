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
#ifndef MEMENTO_SIGNATURE_ARGUMENTS_HPP_
#define MEMENTO_SIGNATURE_ARGUMENTS_HPP_

#include <iosfwd>
#include <map>
#include <string>

#include "memento/signature/canonical_string.hpp"

namespace memento {
namespace signature {
/**
 * @brief Arguments of one invocation, by parameter name.
 * @ingroup SIGNATURE
 * @details
 * Values are converted to their canonical strings as soon as they are set, so this object
 * doesn't hold on to the caller's values. The typed values themselves are captured by the
 * computation, usually a lambda, which CachedFunction invokes on a miss.
 */
class Arguments {
 public:
  Arguments() {}

  template <typename T>
  Arguments&  set(const std::string& name, const T& value) {
    return set_canonical(name, to_canonical_string(value));
  }
  Arguments&  set(const std::string& name, const char* value) {
    return set_canonical(name, to_canonical_string(value));
  }
  /** Sets an already canonical string. Replaces the previous value of the same name. */
  Arguments&  set_canonical(const std::string& name, const std::string& canonical_value) {
    values_[name] = canonical_value;
    return *this;
  }

  bool        has(const std::string& name) const { return values_.find(name) != values_.end(); }
  /** Returns nullptr if not set. */
  const std::string* find(const std::string& name) const {
    std::map<std::string, std::string>::const_iterator it = values_.find(name);
    if (it == values_.end()) {
      return nullptr;
    }
    return &it->second;
  }
  size_t      size() const { return values_.size(); }
  const std::map<std::string, std::string>& get_values() const { return values_; }

  friend std::ostream& operator<<(std::ostream& o, const Arguments& v);

 private:
  std::map<std::string, std::string> values_;
};

}  // namespace signature
}  // namespace memento
#endif  // MEMENTO_SIGNATURE_ARGUMENTS_HPP_
