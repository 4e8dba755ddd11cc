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
#ifndef MEMENTO_ERROR_STACK_BATCH_HPP_
#define MEMENTO_ERROR_STACK_BATCH_HPP_

#include <stdint.h>

#include <iosfwd>
#include <utility>
#include <vector>

#include "memento/error_stack.hpp"

namespace memento {
/**
 * @brief Batches zero or more ErrorStack objects to represent in one ErrorStack.
 * @ingroup ERRORCODES
 * @details
 * This companion class of ErrorStack is used where we might observe more than one errors
 * but have to return only one ErrorStack object; e.g., Initializable#uninitialize(), or
 * the cache inspector which keeps scanning after an unreadable entry.
 */
class ErrorStackBatch {
 public:
  ErrorStackBatch() {}
  ErrorStackBatch(const ErrorStackBatch &other) : error_batch_(other.error_batch_) {}
  ErrorStackBatch& operator=(const ErrorStackBatch &other) {
    error_batch_ = other.error_batch_;
    return *this;
  }
  ErrorStackBatch(ErrorStackBatch &&other) {
    error_batch_ = std::move(other.error_batch_);
  }
  ErrorStackBatch& operator=(ErrorStackBatch &&other) {
    error_batch_ = std::move(other.error_batch_);
    return *this;
  }

  void clear() { error_batch_.clear(); }

  /**
   * If the given ErrorStack is an error, this method adds it to the end of this batch.
   */
  void push_back(const ErrorStack &error_stack) {
    if (!error_stack.is_error()) {
      return;
    }
    error_batch_.push_back(error_stack);
  }

  /** Same as push_back() but steals the given object. */
  void emplace_back(ErrorStack &&error_stack) {
    if (!error_stack.is_error()) {
      return;
    }
    error_batch_.emplace_back(error_stack);
  }

  /** Returns whether there was any error. */
  bool        is_error() const { return !error_batch_.empty(); }

  /** Number of errors collected so far. */
  size_t      size() const { return error_batch_.size(); }

  /**
   * Instantiate an ErrorStack object that summarizes all errors in this batch.
   * Consider using SUMMARIZE_ERROR_BATCH(batch).
   */
  ErrorStack  summarize(const char* filename, const char* func, uint32_t linenum) const;

  friend std::ostream& operator<<(std::ostream& o, const ErrorStackBatch& obj);

 private:
  std::vector<ErrorStack> error_batch_;
};
}  // namespace memento

/**
 * @def SUMMARIZE_ERROR_BATCH(batch)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls ErrorStackBatch#summarize() with automatically provided parameters.
 */
#define SUMMARIZE_ERROR_BATCH(x) x.summarize(__FILE__, __FUNCTION__, __LINE__)

#endif  // MEMENTO_ERROR_STACK_BATCH_HPP_
