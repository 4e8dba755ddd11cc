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
#ifndef MEMENTO_SIGNATURE_CANONICALIZER_HPP_
#define MEMENTO_SIGNATURE_CANONICALIZER_HPP_

#include <string>
#include <utility>
#include <vector>

#include "memento/error_stack.hpp"
#include "memento/signature/fwd.hpp"

namespace memento {
namespace signature {
/**
 * @brief Renders a call into its canonical signature string.
 * @ingroup SIGNATURE
 * @details
 * @par Binding
 * Every given argument must name a declared input. Declared inputs that are not given take
 * their default, and an input with neither is an error. Output directories are created by
 * the engine, so giving a value for one is an error too.
 *
 * @par Filtering and rendering
 * In declaration order, each bound input renders as name=value unless it is excluded, or it
 * is exclude-if-default and its canonical value equals the canonical default.
 * The pairs are joined with ';'. '\\', '=' and ';' in names and values are escaped with a
 * backslash, so different pair lists never render the same text.
 * A call whose inputs are all filtered out renders as the empty string.
 */
class Canonicalizer {
 public:
  /** Name and canonical value of each bound input, in declaration order. */
  typedef std::vector< std::pair<std::string, std::string> > BoundArguments;

  Canonicalizer() = delete;

  /**
   * @brief Binds arguments to the declared inputs.
   * @return kErrorCodeSigUnknownArgument, kErrorCodeSigOutputDirSupplied or
   * kErrorCodeSigMissingArgument
   */
  static ErrorStack   bind(
    const FunctionSignature& signature,
    const Arguments& arguments,
    BoundArguments* out);

  /** Drops excluded pairs and renders the rest. */
  static std::string  render(const FunctionSignature& signature, const BoundArguments& bound);

  /** bind() then render(). */
  static ErrorStack   canonicalize(
    const FunctionSignature& signature,
    const Arguments& arguments,
    std::string* out);

  /** Escapes '\\', '=' and ';'. */
  static std::string  escape(const std::string& text);
};

}  // namespace signature
}  // namespace memento
#endif  // MEMENTO_SIGNATURE_CANONICALIZER_HPP_
