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
#include "memento/engine_pimpl.hpp"

#include <glog/logging.h>

#include <ostream>
#include <sstream>
#include <string>

#include "memento/error_stack_batch.hpp"
#include "memento/debugging/stop_watch.hpp"
#include "memento/entry/entry_paths.hpp"
#include "memento/entry/output_materializer.hpp"
#include "memento/signature/canonicalizer.hpp"
#include "memento/signature/key_hasher.hpp"

namespace memento {

EnginePimpl::EnginePimpl(const EngineOptions &options) :
  options_(options),
  debug_(options.debugging_),
  backend_(options.storage_.durable_commit_),
  committer_(&backend_, options.storage_.durable_commit_),
  hits_(0),
  misses_(0),
  corrupt_recoveries_(0),
  conflicts_(0),
  computation_failures_(0) {
}

ErrorStack EnginePimpl::check_valid_options() const {
  if (options_.storage_.cache_root_.empty()) {
    return ERROR_STACK_MSG(kErrorCodeConfCacheRootUnset,
      "Set EngineOptions::storage_.cache_root_ before starting the engine");
  }
  return kRetOk;
}

ErrorStack EnginePimpl::initialize_once() {
  // nothing to release yet if the options are broken
  CHECK_ERROR(check_valid_options());
  // glog next so that everything below can log
  CHECK_ERROR(debug_.initialize());
  cache_root_ = fs::Path(options_.storage_.cache_root_);
  CHECK_ERROR(backend_.make_dirs(cache_root_));
  LOG(INFO) << "================================================================================";
  LOG(INFO) << "================== MEMENTO ENGINE INITIALIZATION DONE ==========================";
  LOG(INFO) << "=== cache root: " << cache_root_ << ", durable_commit: "
    << options_.storage_.durable_commit_;
  LOG(INFO) << "================================================================================";
  return kRetOk;
}

ErrorStack EnginePimpl::uninitialize_once() {
  LOG(INFO) << "================================================================================";
  LOG(INFO) << "=================== MEMENTO ENGINE EXITTING...... ==============================";
  LOG(INFO) << "=== " << get_statistics();
  LOG(INFO) << "================================================================================";
  ErrorStackBatch batch;
  {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    registry_.clear();
  }
  // release glog at the end. we can't use glog since now
  batch.emplace_back(debug_.uninitialize());
  return SUMMARIZE_ERROR_BATCH(batch);
}

ErrorStack EnginePimpl::register_function(const signature::FunctionSignature& function) {
  CHECK_ERROR(function.validate());
  std::lock_guard<std::mutex> guard(registry_mutex_);
  if (registry_.find(function.get_function_name()) != registry_.end()) {
    return ERROR_STACK_MSG(kErrorCodeConfDuplicateFunction, function.get_function_name().c_str());
  }
  registry_.insert(std::make_pair(function.get_function_name(), function));
  LOG(INFO) << "Registered " << function;
  return kRetOk;
}

bool EnginePimpl::is_registered(const std::string& function_name) const {
  std::lock_guard<std::mutex> guard(registry_mutex_);
  return registry_.find(function_name) != registry_.end();
}

ErrorStack EnginePimpl::check_callable(const signature::FunctionSignature& function) const {
  if (!is_initialized()) {
    return ERROR_STACK(kErrorCodeNotInitialized);
  }
  if (!is_registered(function.get_function_name())) {
    return ERROR_STACK_MSG(kErrorCodeConfFunctionNotRegistered,
      function.get_function_name().c_str());
  }
  CHECK_ERROR(check_same_as_registered(function));
  return kRetOk;
}

ErrorStack EnginePimpl::check_same_as_registered(
  const signature::FunctionSignature& function) const {
  std::lock_guard<std::mutex> guard(registry_mutex_);
  std::map<std::string, signature::FunctionSignature>::const_iterator it
    = registry_.find(function.get_function_name());
  if (it != registry_.end() && it->second != function) {
    // keys computed from this one would disagree with what the registered one publishes
    std::stringstream str;
    str << "registered: " << it->second << ", given: " << function;
    return ERROR_STACK_MSG(kErrorCodeConfSignatureMismatch, str.str().c_str());
  }
  return kRetOk;
}

ErrorStack EnginePimpl::resolve_key(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  std::string* canonical_signature,
  std::string* key) const {
  CHECK_ERROR(function.validate());
  CHECK_ERROR(check_same_as_registered(function));
  CHECK_ERROR(compute_key(function, arguments, canonical_signature, key));
  return kRetOk;
}

ErrorStack EnginePimpl::compute_key(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  std::string* canonical_signature,
  std::string* key) const {
  CHECK_ERROR(signature::Canonicalizer::canonicalize(function, arguments, canonical_signature));
  CHECK_ERROR(signature::KeyHasher::compute_key(
    function.get_function_name(),
    *canonical_signature,
    key));
  return kRetOk;
}

entry::EntryValidity EnginePimpl::read_and_accept(
  const signature::FunctionSignature& function,
  const entry::EntryPaths& paths,
  const ReturnValueHandler& handler,
  CallResult* result) {
  std::string blob;
  entry::EntryValidity validity = committer_.read_published(
    paths,
    handler.has_return_value_,
    &blob);
  if (validity == entry::kEntryValid && handler.has_return_value_ && handler.load_) {
    ErrorCode decode_error = handler.load_(blob);
    if (decode_error != kErrorCodeOk) {
      LOG(WARNING) << "Failed to decode return value of " << paths.get_published_path()
        << ": " << get_error_name(decode_error);
      validity = entry::kEntryCorrupt;
    }
  }

  if (validity == entry::kEntryValid) {
    result->return_blob_ = blob;
    result->output_dirs_ = entry::OutputMaterializer::resolve(function, paths.get_published_path());
    result->hit_ = true;
    result->key_ = paths.get_key();
    result->entry_path_ = paths.get_published_path();
  } else if (validity == entry::kEntryCorrupt) {
    LOG(WARNING) << "Discarding corrupt entry " << paths.get_published_path();
    ErrorStack discard_error = committer_.discard_published(paths);
    if (discard_error.is_error()) {
      LOG(ERROR) << "Failed to discard corrupt entry: " << discard_error;
    }
  } else if (validity == entry::kEntryIncomplete && options_.storage_.remove_invalid_entries_) {
    LOG(INFO) << "Removing published entry without success token " << paths.get_published_path();
    ErrorStack discard_error = committer_.discard_published(paths);
    if (discard_error.is_error()) {
      LOG(ERROR) << "Failed to remove incomplete entry: " << discard_error;
    }
  }
  return validity;
}

ErrorStack EnginePimpl::get_or_compute(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  const ReturnValueHandler& handler,
  const Computation& computation,
  CallResult* result) {
  CHECK_ERROR(check_callable(function));
  std::string canonical_signature;
  std::string key;
  CHECK_ERROR(compute_key(function, arguments, &canonical_signature, &key));
  entry::EntryPaths paths(cache_root_, function.get_function_name(), key);

  entry::EntryState state = entry::kResolving;
  entry::EntryValidity validity = read_and_accept(function, paths, handler, result);
  if (validity == entry::kEntryValid) {
    state = entry::kHit;
    ++hits_;
    VLOG(1) << state << ": " << function.get_function_name() << "(" << canonical_signature
      << ") -> " << paths.get_published_path();
    return kRetOk;
  }

  state = entry::kMiss;
  ++misses_;
  if (validity == entry::kEntryCorrupt) {
    ++corrupt_recoveries_;
  }
  LOG(INFO) << state << ": " << function.get_function_name() << "(" << canonical_signature
    << "). Computing " << paths.get_published_path();
  return compute_and_publish(function, paths, handler, computation, result);
}

ErrorStack EnginePimpl::compute_and_publish(
  const signature::FunctionSignature& function,
  const entry::EntryPaths& paths,
  const ReturnValueHandler& handler,
  const Computation& computation,
  CallResult* result) {
  entry::EntryState state = entry::kStaging;
  ErrorStack error = committer_.prepare_staging(paths);
  entry::OutputDirPaths staging_dirs;
  if (!error.is_error()) {
    error = entry::OutputMaterializer::materialize(
      &backend_,
      function,
      paths.get_staging_path(),
      &staging_dirs);
  }

  std::string blob;
  debugging::StopWatch watch;
  if (!error.is_error()) {
    state = entry::kComputing;
    VLOG(1) << state << " in " << paths.get_staging_path();
    error = computation(staging_dirs, &blob);
    watch.stop();
    if (error.is_error()) {
      ++computation_failures_;
    }
  }

  if (!error.is_error()) {
    state = entry::kCommitting;
    VLOG(1) << state << " " << paths.get_published_path();
    error = committer_.commit(paths, handler.has_return_value_, blob);
    if (error.is_error() && error.get_error_code() == kErrorCodeEntryConcurrentWriteConflict) {
      ++conflicts_;
      LOG(WARNING) << "Another writer published " << paths.get_published_path()
        << " first. This call fails with a conflict.";
    }
  }

  if (error.is_error()) {
    LOG(INFO) << entry::kFailed << " in state " << state << ": " << paths.get_published_path();
    ErrorStack discard_error = committer_.discard_staging(paths);
    if (discard_error.is_error()) {
      LOG(ERROR) << "Failed to remove staging directory " << paths.get_staging_path()
        << ": " << discard_error;
    }
    return ErrorStack(error, __FILE__, __FUNCTION__, __LINE__);
  }

  state = entry::kHit;
  LOG(INFO) << state << ": published " << paths.get_published_path() << ", computed in "
    << watch.elapsed_ms() << "ms";
  result->return_blob_ = blob;
  result->output_dirs_ = entry::OutputMaterializer::resolve(function, paths.get_published_path());
  result->hit_ = false;
  result->key_ = paths.get_key();
  result->entry_path_ = paths.get_published_path();
  return kRetOk;
}

ErrorStack EnginePimpl::lookup(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments,
  const ReturnValueHandler& handler,
  CallResult* result) {
  CHECK_ERROR(check_callable(function));
  std::string canonical_signature;
  std::string key;
  CHECK_ERROR(compute_key(function, arguments, &canonical_signature, &key));
  entry::EntryPaths paths(cache_root_, function.get_function_name(), key);
  entry::EntryValidity validity = read_and_accept(function, paths, handler, result);
  if (validity != entry::kEntryValid) {
    return ERROR_STACK_MSG(kErrorCodeEntryNotFound, paths.get_published_path().c_str());
  }
  ++hits_;
  VLOG(1) << "Lookup hit " << paths.get_published_path();
  return kRetOk;
}

ErrorStack EnginePimpl::invalidate(
  const signature::FunctionSignature& function,
  const signature::Arguments& arguments) {
  CHECK_ERROR(check_callable(function));
  std::string canonical_signature;
  std::string key;
  CHECK_ERROR(compute_key(function, arguments, &canonical_signature, &key));
  entry::EntryPaths paths(cache_root_, function.get_function_name(), key);
  LOG(INFO) << "Invalidating " << paths.get_published_path();
  CHECK_ERROR(committer_.discard_published(paths));
  return kRetOk;
}

EngineStatistics EnginePimpl::get_statistics() const {
  EngineStatistics ret;
  ret.hits_ = hits_.load();
  ret.misses_ = misses_.load();
  ret.corrupt_recoveries_ = corrupt_recoveries_.load();
  ret.conflicts_ = conflicts_.load();
  ret.computation_failures_ = computation_failures_.load();
  return ret;
}

std::string EnginePimpl::describe() const {
  std::stringstream str;
  str << "<Engine>"
    << "<cache_root_>" << cache_root_ << "</cache_root_>"
    << backend_
    << "<remove_invalid_entries_>" << options_.storage_.remove_invalid_entries_
      << "</remove_invalid_entries_>";
  {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    str << "<functions_>";
    for (const auto& function : registry_) {
      str << "<function>" << function.first << "</function>";
    }
    str << "</functions_>";
  }
  str << get_statistics() << "</Engine>";
  return str.str();
}

std::ostream& operator<<(std::ostream& o, const EngineStatistics& v) {
  o << "<EngineStatistics>"
    << "<hits_>" << v.hits_ << "</hits_>"
    << "<misses_>" << v.misses_ << "</misses_>"
    << "<corrupt_recoveries_>" << v.corrupt_recoveries_ << "</corrupt_recoveries_>"
    << "<conflicts_>" << v.conflicts_ << "</conflicts_>"
    << "<computation_failures_>" << v.computation_failures_ << "</computation_failures_>"
    << "</EngineStatistics>";
  return o;
}

}  // namespace memento
