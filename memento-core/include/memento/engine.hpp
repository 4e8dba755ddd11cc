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
#ifndef MEMENTO_ENGINE_HPP_
#define MEMENTO_ENGINE_HPP_

#include <string>

#include "memento/computation.hpp"
#include "memento/engine_statistics.hpp"
#include "memento/error_stack.hpp"
#include "memento/fwd.hpp"
#include "memento/initializable.hpp"
#include "memento/debugging/fwd.hpp"
#include "memento/fs/path.hpp"
#include "memento/signature/fwd.hpp"
#include "memento/storage/fwd.hpp"

namespace memento {
/**
 * @brief Memoization engine. The starting point of everything.
 * @ingroup IDIOMS
 * @details
 * An engine owns the cache root given in EngineOptions and the functions registered to it.
 * Calls go through get_or_compute(), or through the typed wrapper CachedFunction.
 *
 * @par Lifecycle
 * @code{.cpp}
 * EngineOptions options;
 * options.storage_.cache_root_ = "/data/memento";
 * Engine engine(options);
 * CHECK_ERROR(engine.initialize());
 * signature::FunctionSignature sig("sum");
 * sig.add_input("x").add_input("y");
 * CHECK_ERROR(engine.register_function(sig));
 * ... calls ...
 * CHECK_ERROR(engine.uninitialize());
 * @endcode
 * initialize() fails with kErrorCodeConfCacheRootUnset if the cache root is empty.
 *
 * @par Thread safety
 * Calls from multiple threads are fine once the engine is initialized and the functions are
 * registered. Calls on the same key from different threads or processes can both miss and
 * compute. The first to publish wins and the other gets kErrorCodeEntryConcurrentWriteConflict.
 *
 * @par Logging
 * A hit is silent except VLOG(1). A miss logs the entry path with LOG(INFO) before computing.
 * A corrupt entry is logged with LOG(WARNING) and recomputed.
 */
class Engine final : public virtual Initializable {
 public:
  /**
   * @brief Instantiates an engine object which is \b NOT initialized yet.
   * @details
   * To start the engine, call initialize() afterwards.
   * This constructor does nothing but instantiation.
   */
  explicit Engine(const EngineOptions &options);
  /** Do NOT rely on this destructor to release resources. Call uninitialize() instead. */
  ~Engine();

  // Disable default constructors
  Engine() = delete;
  Engine(const Engine &) = delete;
  Engine& operator=(const Engine &) = delete;

  /** Cache root, backend and counters in a human-readable form. */
  std::string describe() const;

  /**
   * Starts up the engine. Initializes glog, resolves the cache root into an absolute path
   * and creates the directory if it doesn't exist.
   */
  ErrorStack  initialize() override;
  bool        is_initialized() const override;
  /** Logs the counters and releases glog. */
  ErrorStack  uninitialize() override;

  /**
   * @brief Validates the signature and makes the function callable.
   * @return kErrorCodeConfDuplicateFunction if a function of the same name is registered,
   * or any error of signature::FunctionSignature::validate().
   */
  ErrorStack  register_function(const signature::FunctionSignature& function);
  bool        is_registered(const std::string& function_name) const;

  /**
   * @brief Returns the stored result of an equivalent call, or computes, stores and returns it.
   * @details
   * On a miss, creates a staging entry, invokes computation with its output directories,
   * and publishes the entry. A corrupt published entry is removed and recomputed.
   * @return the computation's own error if it fails,
   * kErrorCodeEntryConcurrentWriteConflict if another writer published the entry first, or
   * kErrorCodeConfSignatureMismatch if function isn't the signature registered under its name.
   */
  ErrorStack  get_or_compute(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    const ReturnValueHandler& handler,
    const Computation& computation,
    CallResult* result);

  /**
   * @brief Returns the stored result without ever computing.
   * @return kErrorCodeEntryNotFound unless a valid entry is published.
   */
  ErrorStack  lookup(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    const ReturnValueHandler& handler,
    CallResult* result);

  /** Removes the published entry of the call. Succeeds if there is none. */
  ErrorStack  invalidate(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments);

  /**
   * Canonical signature and key of a call. Doesn't touch the disk.
   * The function need not be registered, but it must pass validate() and must be equal to
   * the registered one if there is one of the same name.
   */
  ErrorStack  resolve_key(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    std::string* canonical_signature,
    std::string* key) const;

  const EngineOptions&            get_options() const;
  /** The absolute cache root. Valid after initialize(). */
  const fs::Path&                 get_cache_root() const;
  EngineStatistics                get_statistics() const;
  debugging::DebuggingSupports*   get_debug() const;
  storage::StorageBackend*        get_storage_backend() const;

 private:
  EnginePimpl* pimpl_;
};
}  // namespace memento
#endif  // MEMENTO_ENGINE_HPP_
