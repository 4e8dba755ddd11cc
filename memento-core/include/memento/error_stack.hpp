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
#ifndef MEMENTO_ERROR_STACK_HPP_
#define MEMENTO_ERROR_STACK_HPP_

#include <stdint.h>

#include <cerrno>
#include <cstring>
#include <iosfwd>
#include <string>

#include "memento/assert_nd.hpp"
#include "memento/compiler.hpp"
#include "memento/error_code.hpp"

namespace memento {

/**
 * @brief Brings error stacktrace information as return value of functions.
 * @ingroup ERRORCODES
 * @details
 * This is returned by most API functions, including the user computations wrapped by the
 * cache engine. As it brings stacktrace information, it's more informative than just returning
 * ErrorCode. However, note that instantiating and augmenting this stack object has some overhead.
 *
 * @par Why not exception
 * We don't throw or catch any exceptions in our program. A computation that fails returns an
 * ErrorStack, and the engine hands that very object back to its caller.
 *
 * @par Macros to help use ErrorStack
 * In most places, you should use kRetOk, CHECK_ERROR(x), or ERROR_STACK(e) to handle this class.
 * See the doucments of those macros.
 *
 * @par Maximum stack trace depth
 * We limit the depth of stacktraces stored in this object to \ref kMaxStackDepth.
 * We store just line numbers and const pointers to file names. No heap allocation.
 * The only thing that has to be allocated on heap is a custom error message.
 *
 * @par Moveable/Copiable
 * This object is \e copiable. Further, the copy constructor and copy assignment operator
 * are equivalent to \e move. Although they take a const reference, we \e steal its
 * checked_ and custom_message_.
 *
 * This class is header-only \b except output(), dump_and_abort(), and std::ostream redirect.
 */
class ErrorStack {
 public:
  /** Constant values. */
  enum Constants {
     /** Maximum stack trace depth. */
     kMaxStackDepth = 8,
  };

  /** Empty constructor. This is same as duplicating kRetOk. */
  ErrorStack();

  /**
   * @brief Instantiate a return code without a custom error message nor stacktrace.
   * @param[in] code Error code, either kErrorCodeOk or real errors.
   */
  explicit ErrorStack(ErrorCode code);

  /**
   * @brief Instantiate a return code with stacktrace and optionally a custom error message.
   * @param[in] filename file name of the current place. Must be const and permanent, such
   * as what "__FILE__" returns. We do NOT do deep-copy of the strings.
   * @param[in] func functiona name of the current place. Must be const-permanent as well.
   * @param[in] linenum line number of the current place. Usually "__LINE__".
   * @param[in] code Error code, must be real errors.
   * @param[in] custom_message Optional custom error message. We do deep-copy if non-null.
   */
  ErrorStack(const char* filename, const char* func, uint32_t linenum, ErrorCode code,
        const char* custom_message = nullptr);

  /** Copy constructor. */
  ErrorStack(const ErrorStack &other);

  /** Copy constructor to augment the stacktrace. */
  ErrorStack(const ErrorStack &other, const char* filename, const char* func, uint32_t linenum,
        const char* more_custom_message = nullptr);

  /** Assignment operator. */
  ErrorStack& operator=(const ErrorStack &other);

  ~ErrorStack();

  /** Returns if this return code is not kErrorCodeOk. */
  bool                is_error() const;

  /** Return the integer error code. */
  ErrorCode           get_error_code() const;

  /** Returns the error message inferred by the error code. */
  const char*         get_message() const;

  /** Returns the custom error message. */
  const char*         get_custom_message() const;

  /** Returns the errno captured when this stack was instantiated. */
  int                 get_os_errno() const { return os_errno_; }

  /** Copy the given custom message into this object. */
  void                copy_custom_message(const char* message);

  /** Deletes custom message from this object. */
  void                clear_custom_message();

  /** Appends more custom error message at the end. */
  void                append_custom_message(const char* more_custom_message);

  /** Returns the depth of stack this error code has collected. */
  uint16_t            get_stack_depth() const;

  /** Returns the line number of the given stack position. */
  uint32_t            get_linenum(uint16_t stack_index) const;

  /** Returns the file name of the given stack position. */
  const char*         get_filename(uint16_t stack_index) const;

  /** Returns the function name of the given stack position. */
  const char*         get_func(uint16_t stack_index) const;

  /** Output a warning to stderr if the error is not checked yet. */
  void                verify() const;

  /** Describe this object to the given stream. */
  void                output(std::ostream* ptr) const;

  /** Describe this object to std::cerr and then abort. */
  void                dump_and_abort(const char *abort_message) const;

  /** Retrieves the info left by dump_and_abort(). Called by signal handler */
  static std::string  get_recent_dump_and_abort();

  friend std::ostream& operator<<(std::ostream& o, const ErrorStack& obj);

 private:
  /**
   * @brief Filenames of stacktraces.
   * @details
   * This is deep-first, so filenames_[0] is where the ErrorStack was initially instantiated.
   * When we reach kMaxStackDepth, we don't store any more stacktraces.
   */
  const char*     filenames_[kMaxStackDepth];

  /** @brief Functions of stacktraces (no deep-copy as well). */
  const char*     funcs_[kMaxStackDepth];

  /** @brief Line numbers of stacktraces. */
  uint32_t        linenums_[kMaxStackDepth];

  /** @brief Optional custom error message. We deep-copy this string if it's non-NULL. */
  mutable const char*     custom_message_;

  /**
   * @brief Global errno set by a failed system call.
   * @details
   * Retrieved from the \e global errno when this stack is instantiated, so it might be
   * unrelated to the actual error of this stack.
   */
  int             os_errno_;

  /**
   * @brief Integer error code.
   * @invariant
   * If this value is kErrorCodeOk, all other members have no meanings.
   */
  ErrorCode       error_code_;

  /**
   * @brief Current stack depth.
   * Value 0 implies that we don't pass around stacktrace for this return code.
   */
  uint16_t        stack_depth_;

  /** @brief Whether someone already checked the error code of this object. */
  mutable bool    checked_;
};

/**
 * @var kRetOk
 * @ingroup ERRORCODES
 * @brief Normal return value for no-error case.
 */
const ErrorStack kRetOk;

inline ErrorStack::ErrorStack()
  : custom_message_(nullptr), os_errno_(0), error_code_(kErrorCodeOk),
    stack_depth_(0), checked_(true) {
}

inline ErrorStack::ErrorStack(ErrorCode code)
  : custom_message_(nullptr), os_errno_(errno), error_code_(code),
    stack_depth_(0), checked_(false) {
}

inline ErrorStack::ErrorStack(const char* filename, const char* func, uint32_t linenum,
                ErrorCode code, const char* custom_message)
  : custom_message_(nullptr), os_errno_(errno), error_code_(code), stack_depth_(1),
    checked_(false) {
  ASSERT_ND(code != kErrorCodeOk);
  filenames_[0] = filename;
  funcs_[0] = func;
  linenums_[0] = linenum;
  copy_custom_message(custom_message);
}

inline ErrorStack::ErrorStack(const ErrorStack &other)
  : custom_message_(nullptr) {
  operator=(other);
}

inline ErrorStack::ErrorStack(const ErrorStack &other, const char* filename,
              const char* func, uint32_t linenum, const char* more_custom_message)
  : custom_message_(nullptr) {
  // Invariant: if kErrorCodeOk, no more processing
  if (LIKELY(other.error_code_ == kErrorCodeOk)) {
    this->error_code_ = kErrorCodeOk;
    return;
  }

  operator=(other);
  // augment stacktrace
  if (stack_depth_ != 0 && stack_depth_ < kMaxStackDepth) {
    filenames_[stack_depth_] = filename;
    funcs_[stack_depth_] = func;
    linenums_[stack_depth_] = linenum;
    ++stack_depth_;
  }
  if (more_custom_message) {
    append_custom_message(more_custom_message);
  }
}

inline ErrorStack& ErrorStack::operator=(const ErrorStack &other) {
  if (this == &other) {
    return *this;
  }
  // Invariant: if kErrorCodeOk, no more processing
  if (LIKELY(other.error_code_ == kErrorCodeOk)) {
    clear_custom_message();
    this->error_code_ = kErrorCodeOk;
    return *this;
  }

  // this copy assignment is actually a move assignment.
  // checked_/custom_message_ are mutable for that.
  clear_custom_message();
  custom_message_ = other.custom_message_;  // steal.
  other.custom_message_ = nullptr;
  stack_depth_ = other.stack_depth_;
  for (int i = 0; i < other.stack_depth_; ++i) {
    filenames_[i] = other.filenames_[i];
    funcs_[i] = other.funcs_[i];
    linenums_[i] = other.linenums_[i];
  }
  os_errno_ = other.os_errno_;
  error_code_ = other.error_code_;
  checked_ = false;
  other.checked_ = true;
  return *this;
}

inline ErrorStack::~ErrorStack() {
  // Invariant: if kErrorCodeOk, no more processing
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
#ifdef DEBUG
  // We output warning if some error code is not checked, but we don't do so in release mode.
  verify();
#endif  // DEBUG
  clear_custom_message();
}

inline void ErrorStack::clear_custom_message() {
  if (UNLIKELY(custom_message_ != nullptr)) {
    delete[] custom_message_;
    custom_message_ = nullptr;
  }
}

inline void ErrorStack::copy_custom_message(const char* message) {
  // Invariant: if kErrorCodeOk, no more processing
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }

  clear_custom_message();
  if (message) {
    // do NOT use strdup to make sure new/delete everywhere.
    size_t len = std::strlen(message);
    char *copied = new char[len + 1];  // +1 for null terminator
    std::memcpy(copied, message, len + 1);
    custom_message_ = copied;
  }
}

inline void ErrorStack::append_custom_message(const char* more_custom_message) {
  // Invariant: if kErrorCodeOk, no more processing
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  if (custom_message_) {
    size_t cur_len = std::strlen(custom_message_);
    size_t more_len = std::strlen(more_custom_message);
    char *copied = new char[cur_len + more_len + 1];
    std::memcpy(copied, custom_message_, cur_len);
    std::memcpy(copied + cur_len, more_custom_message, more_len + 1);
    clear_custom_message();
    custom_message_ = copied;
  } else {
    copy_custom_message(more_custom_message);  // just put the new message
  }
}

inline bool ErrorStack::is_error() const {
  checked_ = true;
  return error_code_ != kErrorCodeOk;
}

inline ErrorCode ErrorStack::get_error_code() const {
  checked_ = true;
  return error_code_;
}

inline const char* ErrorStack::get_message() const {
  return get_error_message(error_code_);
}

inline const char* ErrorStack::get_custom_message() const {
  if (error_code_ == kErrorCodeOk) {
    return nullptr;
  }
  return custom_message_;
}

inline uint16_t ErrorStack::get_stack_depth() const {
  if (error_code_ == kErrorCodeOk) {
    return 0;
  }
  return stack_depth_;
}

inline uint32_t ErrorStack::get_linenum(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return 0;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return linenums_[stack_index];
}

inline const char* ErrorStack::get_filename(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return nullptr;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return filenames_[stack_index];
}

inline const char* ErrorStack::get_func(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return nullptr;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return funcs_[stack_index];
}

inline void ErrorStack::verify() const {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  if (!checked_) {
    dump_and_abort("Return value is not checked. ErrorStack must be checked");
  }
}

}  // namespace memento

// The followings are macros. So, they belong to no namespaces.

/**
 * @def ERROR_STACK(e)
 * @ingroup ERRORCODES
 * @brief Instantiates ErrorStack with the given memento::error_code,
 * creating an error stack with the current file, line, and error code.
 * @details
 * @code{.cpp}
 * ErrorStack your_func() {
 *   if (cache-root-is-empty) {
 *      return ERROR_STACK(kErrorCodeConfCacheRootUnset);
 *   }
 *   return kRetOk;
 * }
 * @endcode
 */
#define ERROR_STACK(e)      memento::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e)

/**
 * @def ERROR_STACK_MSG(e, m)
 * @ingroup ERRORCODES
 * @brief Overload of ERROR_STACK(e) to receive a custom error message.
 */
#define ERROR_STACK_MSG(e, m)   memento::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e, m)

/**
 * @def CHECK_ERROR(x)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls \b x and checks its returned value.  If an error is encountered, it
 * immediately returns from the current function or method, augmenting
 * the stack trace held by the return code.
 * @note The name is CHECK_ERROR, not CHECK, because Google-logging defines CHECK.
 */
#define CHECK_ERROR(x)\
{\
  memento::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return memento::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__);\
  }\
}

/**
 * @def WRAP_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief
 * Same as CHECK_ERROR(x) except it receives only an error code, thus more efficient.
 * @note Unlike CHECK_ERROR_CODE(x), this returns ErrorStack.
 * @see CHECK_ERROR_CODE(x)
 */
#define WRAP_ERROR_CODE(x)\
{\
  memento::ErrorCode __e = x;\
  if (UNLIKELY(__e != memento::kErrorCodeOk)) {return ERROR_STACK(__e);}\
}

/**
 * @def UNWRAP_ERROR_STACK(x)
 * @ingroup ERRORCODES
 * @brief
 * Similar to WRAP_ERROR_CODE(x), but this one converts ErrorStack to ErrorCode.
 * This reduces information, so use it carefully.
 */
#define UNWRAP_ERROR_STACK(x)\
{\
  memento::ErrorStack __e = x;\
  if (UNLIKELY(__e.is_error())) { return __e.get_error_code(); }\
}

/**
 * @def CHECK_ERROR_MSG(x, m)
 * @ingroup ERRORCODES
 * @brief Overload of CHECK_ERROR(x) to receive a custom error message.
 */
#define CHECK_ERROR_MSG(x, m)\
{\
  memento::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return memento::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__, m);\
  }\
}

/**
 * @def CHECK_OUTOFMEMORY(ptr)
 * @ingroup ERRORCODES
 * @brief
 * This macro checks if \b ptr is nullptr, and if so exists with kErrorCodeOutofmemory error stack.
 */
#define CHECK_OUTOFMEMORY(ptr)\
if (UNLIKELY(!ptr)) {\
  return memento::ErrorStack(__FILE__, __FUNCTION__, __LINE__, memento::kErrorCodeOutofmemory);\
}

/**
 * @def COERCE_ERROR(x)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls \b x and aborts if encounters an error.
 * This should be used only in places that expects no error, mostly in testcases.
 */
#define COERCE_ERROR(x)\
{\
  memento::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    __e.dump_and_abort("Unexpected error happened");\
  }\
}

/**
 * @def COERCE_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief
 * Same as COERCE_ERROR(x) except it receives only an error code.
 */
#define COERCE_ERROR_CODE(x)\
{\
  memento::ErrorCode __ec = x;\
  if (UNLIKELY(__ec != memento::kErrorCodeOk)) {\
    ERROR_STACK(__ec).dump_and_abort("Unexpected error happened");\
  }\
}

#endif  // MEMENTO_ERROR_STACK_HPP_
