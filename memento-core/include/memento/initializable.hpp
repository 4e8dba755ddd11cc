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
#ifndef MEMENTO_INITIALIZABLE_HPP_
#define MEMENTO_INITIALIZABLE_HPP_

#include "memento/error_stack.hpp"

namespace memento {
/**
 * @defgroup INITIALIZABLE Initialize/Uninitialize Resources
 * @ingroup IDIOMS
 * @brief Defines a uniform class interface to initialize/uninitialize non-trivial resources.
 * @details
 * Constructor should not do complicated initialization as it can't return errors.
 * Instead, we universally use initialize()/uninitialize() semantics for long-living objects
 * such as Engine and DebuggingSupports. The cache root check, for example, happens in
 * Engine#initialize() so that a missing root is reported as an ErrorStack.
 *
 * @par DefaultInitializable
 * For most classes, you can use DefaultInitializable class to save repetitive code.
 * @code{.cpp}
 * class YourClass : public DefaultInitializable {
 *  public:
 *     ErrorStack  initialize_once() override;
 *     ErrorStack  uninitialize_once() override;
 * };
 * @endcode
 *
 * @par UninitializeGuard
 * The code that instantiates an Initializable object must call uninitialize(), even when
 * CHECK_ERROR() returns early. UninitializeGuard is an imperfect safety net for that:
 * C++'s destructor can't propagate an ErrorStack, so the guard can only log or abort.
 */

/**
 * The pure-virtual interface to initialize/uninitialize non-trivial resources.
 * @ingroup INITIALIZABLE
 */
class Initializable {
 public:
  virtual ~Initializable() {}

  /**
   * @brief Acquires resources in this object, usually called right after constructor.
   * @pre is_initialized() == FALSE
   * @details
   * If and only if the return value was not an error, is_initialized() will return TRUE.
   * This method is responsible for releasing all acquired resources when initialization fails.
   */
  virtual ErrorStack  initialize() = 0;

  /** Returns whether the object has been already initialized or not. */
  virtual bool        is_initialized() const = 0;

  /**
   * @brief An \e idempotent method to release all resources of this object, if any.
   * @details
   * After this method, is_initialized() will return FALSE.
   * @attention This method is NOT automatically called from the destructor.
   */
  virtual ErrorStack  uninitialize() = 0;
};

/**
 * @brief Typical implementation of Initializable as a skeleton base class.
 * @ingroup INITIALIZABLE
 * @details
 * Derived classes define "ErrorStack initialize_once()" and "ErrorStack uninitialize_once()".
 * Copy constructor and copy assignment are disabled.
 */
class DefaultInitializable : public virtual Initializable {
 public:
  DefaultInitializable() : initialized_(false) {}
  virtual ~DefaultInitializable() {}

  DefaultInitializable(const DefaultInitializable&) = delete;
  DefaultInitializable& operator=(const DefaultInitializable&) = delete;

  ErrorStack  initialize() override final {
    if (is_initialized()) {
      return ERROR_STACK(kErrorCodeAlreadyInitialized);
    }
    ErrorStack init_error = initialize_once();
    if (init_error.is_error()) {
      // if error happes in the middle of initialization, we release resources we acquired.
      CHECK_ERROR(uninitialize_once());
      return init_error;
    }
    initialized_ = true;
    return kRetOk;
  }

  ErrorStack  uninitialize() override final {
    if (!is_initialized()) {
      return kRetOk;
    }
    CHECK_ERROR(uninitialize_once());
    initialized_ = false;
    return kRetOk;
  }

  bool        is_initialized() const override final {
    return initialized_;
  }

  virtual ErrorStack  initialize_once() = 0;
  virtual ErrorStack  uninitialize_once() = 0;

 private:
  bool    initialized_;
};

/**
 * @brief Calls Initializable#uninitialize() automatically when it gets out of scope.
 * @ingroup INITIALIZABLE
 * @details
 * \b NOT \b A \b SILVER \b BULLET! Every code should still call uninitialize() explicitly
 * and handle the returned ErrorStack.
 */
class UninitializeGuard {
 public:
  /** Defines the behavior of this scope guard. */
  enum Policy {
    /** Terminates the entire program if uninitialize() wasn't called. */
    kAbortIfNotExplicitlyUninitialized = 0,
    /**
     * Automatically calls uninitialize() and terminates the program when it returns an error.
     * This is the default.
     */
    kAbortIfUninitializeError,
    /** Automatically calls uninitialize() and just complains on error. */
    kWarnIfUninitializeError,
    /** Automatically calls uninitialize() and says nothing. NOT RECOMMENDED. */
    kSilent,
  };
  explicit UninitializeGuard(Initializable *target, Policy policy = kAbortIfUninitializeError)
    : target_(target), policy_(policy) {}
  ~UninitializeGuard();

 private:
  Initializable*  target_;
  Policy          policy_;
};

}  // namespace memento
#endif  // MEMENTO_INITIALIZABLE_HPP_
