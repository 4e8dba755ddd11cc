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
#ifndef MEMENTO_ERROR_CODE_HPP_
#define MEMENTO_ERROR_CODE_HPP_

#include "memento/compiler.hpp"

namespace memento {

/**
 * @defgroup ERRORCODES Error codes, messages, and stacktraces
 * @ingroup IDIOMS
 * @brief Error codes (memento::ErrorCode), their error messages defined in error_code.xmacro, and
 * stacktrace information (ErrorStack) returned by our API functions.
 * @details
 * @par What it is
 * We define all error codes and their error messages here.
 * Whenever you want a new error message, add a new line in error_code.xmacro like existing lines.
 * This file is completely independent and header-only. Just include this file to use.
 *
 * @par X-Macros
 * To concisely define error codes, error names, and error messages,
 * we use the so-called "X Macro" style, which doesn't require any code generation.
 * @see http://en.wikipedia.org/wiki/X_Macro
 *
 * @par Error families
 * The cache engine reports four families of errors. Configuration errors (kErrorCodeConf*)
 * are static misuses and never retried. Computation errors are whatever the wrapped
 * computation returned, passed back untouched. kErrorCodeEntryCorrupt is recovered inside the
 * engine and never reaches the caller. kErrorCodeEntryConcurrentWriteConflict is returned to
 * the losing side of a same-key race.
 *
 * @par ErrorCode vs ErrorStack
 * memento::ErrorCode is merely an integer to identify the type of error.
 * Lightweight internal functions return ErrorCode. Public API methods return ErrorStack, which
 * additionally contains stacktrace and custom error message.
 */

#define X(a, b, c) /** b: c. */ a = b,
/**
 * @var ErrorCode
 * @ingroup ERRORCODES
 * @brief Enum of error codes defined in error_code.xmacro.
 */
enum ErrorCode {
  /** 0 means no-error. */
  kErrorCodeOk = 0,
#include "memento/error_code.xmacro" // NOLINT
};
#undef X

/**
 * @brief Returns the names of ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_name(ErrorCode code);

/**
 * @brief Returns the error messages corresponding to ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_message(ErrorCode code);

#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b, c) case a: return X_EXPAND_AND_QUOTE(a);
inline const char* get_error_name(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "kErrorCodeOk";
#include "memento/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE

#define X(a, b, c) case a: return c;
inline const char* get_error_message(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "no_error";
#include "memento/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X

/**
 * @brief Whether the code belongs to the configuration error family.
 * @ingroup ERRORCODES
 */
inline bool is_configuration_error(ErrorCode code) {
  return (static_cast<int>(code) & 0xFF00) == 0x0100;
}
}  // namespace memento

/**
 * @def CHECK_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls \b x and checks its returned error code.  If the code is NOT kErrorCodeOk, it
 * immediately returns from the current function or method, returning the error code code.
 * @see WRAP_ERROR_CODE(x)
 */
#define CHECK_ERROR_CODE(x)\
{\
  memento::ErrorCode __e = x;\
  if (UNLIKELY(__e != memento::kErrorCodeOk)) {\
    return __e;\
  }\
}

#endif  // MEMENTO_ERROR_CODE_HPP_
