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
#ifndef MEMENTO_ENGINE_PIMPL_HPP_
#define MEMENTO_ENGINE_PIMPL_HPP_

#include <stdint.h>

#include <atomic>
#include <map>
#include <mutex>
#include <string>

#include "memento/computation.hpp"
#include "memento/engine_options.hpp"
#include "memento/engine_statistics.hpp"
#include "memento/fwd.hpp"
#include "memento/initializable.hpp"
// This is pimpl. no need for further indirections. just include them all.
#include "memento/debugging/debugging_supports.hpp"
#include "memento/entry/entry_committer.hpp"
#include "memento/entry/fwd.hpp"
#include "memento/fs/path.hpp"
#include "memento/signature/function_signature.hpp"
#include "memento/storage/local_storage_backend.hpp"

namespace memento {
/**
 * @brief Pimpl object of Engine.
 * @ingroup IDIOMS
 * @details
 * A private pimpl object for Engine.
 * Do not include this header from a client program unless you know what you are doing.
 */
class EnginePimpl final : public DefaultInitializable {
 public:
  EnginePimpl() = delete;
  explicit EnginePimpl(const EngineOptions &options);

  ErrorStack  initialize_once() override;
  ErrorStack  uninitialize_once() override;

  /** Returns an error if options_ can't start an engine. */
  ErrorStack  check_valid_options() const;

  ErrorStack  register_function(const signature::FunctionSignature& function);
  bool        is_registered(const std::string& function_name) const;

  /**
   * Common preamble of all calls: engine is up and the function is registered with exactly
   * this signature.
   */
  ErrorStack  check_callable(const signature::FunctionSignature& function) const;
  /** kErrorCodeConfSignatureMismatch if another signature is registered under the name. */
  ErrorStack  check_same_as_registered(const signature::FunctionSignature& function) const;
  /** Validates the signature first. Unregistered functions are allowed. */
  ErrorStack  resolve_key(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    std::string* canonical_signature,
    std::string* key) const;
  ErrorStack  compute_key(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    std::string* canonical_signature,
    std::string* key) const;

  ErrorStack  get_or_compute(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    const ReturnValueHandler& handler,
    const Computation& computation,
    CallResult* result);
  ErrorStack  lookup(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments,
    const ReturnValueHandler& handler,
    CallResult* result);
  ErrorStack  invalidate(
    const signature::FunctionSignature& function,
    const signature::Arguments& arguments);

  /**
   * Reads the published entry and decodes it with the handler.
   * A corrupt entry is discarded here, and reported as kEntryCorrupt.
   */
  entry::EntryValidity  read_and_accept(
    const signature::FunctionSignature& function,
    const entry::EntryPaths& paths,
    const ReturnValueHandler& handler,
    CallResult* result);
  /** The miss path: staging, computing, committing. */
  ErrorStack  compute_and_publish(
    const signature::FunctionSignature& function,
    const entry::EntryPaths& paths,
    const ReturnValueHandler& handler,
    const Computation& computation,
    CallResult* result);

  EngineStatistics  get_statistics() const;
  std::string       describe() const;

  EngineOptions                   options_;

  /** Absolute form of options_.storage_.cache_root_. Set in initialize_once(). */
  fs::Path                        cache_root_;

// Individual modules. Placed in initialize()/uninitialize() order
  debugging::DebuggingSupports    debug_;
  storage::LocalStorageBackend    backend_;
  entry::EntryCommitter           committer_;

  /** Registered functions by name. Protected by registry_mutex_. */
  std::map<std::string, signature::FunctionSignature> registry_;
  mutable std::mutex              registry_mutex_;

  std::atomic<uint64_t>           hits_;
  std::atomic<uint64_t>           misses_;
  std::atomic<uint64_t>           corrupt_recoveries_;
  std::atomic<uint64_t>           conflicts_;
  std::atomic<uint64_t>           computation_failures_;
};
}  // namespace memento
#endif  // MEMENTO_ENGINE_PIMPL_HPP_
