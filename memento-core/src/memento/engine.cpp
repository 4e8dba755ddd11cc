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
#include "memento/engine.hpp"

#include <string>

#include "memento/engine_pimpl.hpp"

namespace memento {
Engine::Engine(const EngineOptions& options) : pimpl_(nullptr) {
  pimpl_ = new EnginePimpl(options);
}
Engine::~Engine() {
  delete pimpl_;
}

// simply forward to pimpl object
std::string Engine::describe() const { return pimpl_->describe(); }
const EngineOptions& Engine::get_options() const    { return pimpl_->options_; }
const fs::Path& Engine::get_cache_root() const      { return pimpl_->cache_root_; }
EngineStatistics Engine::get_statistics() const     { return pimpl_->get_statistics(); }
debugging::DebuggingSupports* Engine::get_debug() const   { return &pimpl_->debug_; }
storage::StorageBackend* Engine::get_storage_backend() const { return &pimpl_->backend_; }

bool                Engine::is_initialized() const  { return pimpl_->is_initialized(); }
ErrorStack          Engine::initialize()            { return pimpl_->initialize(); }
ErrorStack          Engine::uninitialize()          { return pimpl_->uninitialize(); }

ErrorStack Engine::register_function(const signature::FunctionSignature& function) {
  return pimpl_->register_function(function);
}
bool Engine::is_registered(const std::string& function_name) const {
  return pimpl_->is_registered(function_name);
}

ErrorStack Engine::get_or_compute(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  const ReturnValueHandler& handler,
  const Computation& computation,
  CallResult* result) {
  return pimpl_->get_or_compute(function, arguments, handler, computation, result);
}

ErrorStack Engine::lookup(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  const ReturnValueHandler& handler,
  CallResult* result) {
  return pimpl_->lookup(function, arguments, handler, result);
}

ErrorStack Engine::invalidate(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments) {
  return pimpl_->invalidate(function, arguments);
}

ErrorStack Engine::resolve_key(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  std::string* canonical_signature,
  std::string* key) const {
  return pimpl_->resolve_key(function, arguments, canonical_signature, key);
}

}  // namespace memento
