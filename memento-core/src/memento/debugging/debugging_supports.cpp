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
#include "memento/debugging/debugging_supports.hpp"

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <mutex>
#include <string>

#include "memento/assert_nd.hpp"

namespace memento {
namespace debugging {
/**
 * @brief This and static_glog_initialize_lock are the \b only static variables
 * we have in the entire code base.
 * @details
 * Because google-logging requires initialization/uninitialization only once in a process,
 * we need this to coordinate it between multiple engines.
 * We increment/decrement this after taking lock on static_glog_initialize_lock.
 * The one who observed "0" as old value on increment, will initialize glog.
 * The one who observed "1" as old value on decrement, will uninitialize glog.
 * @invariant 0 or larger. negative value is definitely a bug in synchronization code.
 */
int         static_glog_initialize_counter = 0;

/**
 * @brief Exclusive lock variable for Google-logging's initialization/uninitialization.
 */
std::mutex  static_glog_initialize_lock;

void DebuggingSupports::initialize_glog() {
  std::lock_guard<std::mutex> guard(static_glog_initialize_lock);  // implies fence too
  ASSERT_ND(static_glog_initialize_counter >= 0);
  if (static_glog_initialize_counter == 0) {
    if (google::IsGoogleLoggingInitialized()) {
      // the hosting program (eg memento_inspect) initialized glog by itself.
      // we just apply our flags without taking over the ownership.
      LOG(INFO) << "initialize_glog(): GLOG was initialized by the program. Not re-initializing";
      static_glog_initialize_counter = 1;  // so that we never shut it down
    } else {
      FLAGS_logtostderr = options_.debug_log_to_stderr_;
      FLAGS_stderrthreshold = static_cast<int>(options_.debug_log_stderr_threshold_);
      FLAGS_minloglevel = static_cast<int>(options_.debug_log_min_threshold_);
      FLAGS_log_dir = options_.debug_log_dir_;  // This one must be BEFORE InitGoogleLogging()
      FLAGS_v = options_.verbose_log_level_;
      if (options_.verbose_modules_.size() > 0) {
        google::SetVLOGLevel(options_.verbose_modules_.c_str(), options_.verbose_log_level_);
      }
      // InitGoogleLogging keeps the given pointer without copying. Give a really static string.
      google::InitGoogleLogging("libmemento");
      LOG(INFO) << "initialize_glog(): Initialized GLOG";
    }
  } else {
    LOG(INFO) << "initialize_glog(): Observed that someone else has initialized GLOG";
  }
  ++static_glog_initialize_counter;
}

void DebuggingSupports::uninitialize_glog() {
  std::lock_guard<std::mutex> guard(static_glog_initialize_lock);  // implies fence too
  ASSERT_ND(static_glog_initialize_counter >= 1);
  if (static_glog_initialize_counter == 1) {
    LOG(INFO) << "uninitialize_glog(): Uninitializing GLOG...";
    google::ShutdownGoogleLogging();
  } else {
    LOG(INFO) << "uninitialize_glog(): There are still some other GLOG user.";
  }
  --static_glog_initialize_counter;
}

ErrorStack DebuggingSupports::initialize_once() {
  initialize_glog();  // initialize glog at the beginning. we can use glog since now
  return kRetOk;
}
ErrorStack DebuggingSupports::uninitialize_once() {
  uninitialize_glog();  // release glog at the end. we can't use glog since now
  return kRetOk;
}

void DebuggingSupports::set_debug_log_to_stderr(bool value) {
  FLAGS_logtostderr = value;
  LOG(INFO) << "Changed glog's FLAGS_logtostderr to " << value;
}
void DebuggingSupports::set_debug_log_stderr_threshold(DebuggingOptions::DebugLogLevel level) {
  FLAGS_stderrthreshold = static_cast<int>(level);
  LOG(INFO) << "Changed glog's FLAGS_stderrthreshold to " << level;
}
void DebuggingSupports::set_debug_log_min_threshold(DebuggingOptions::DebugLogLevel level) {
  FLAGS_minloglevel = static_cast<int>(level);
  LOG(INFO) << "Changed glog's FLAGS_minloglevel to " << level;
}
void DebuggingSupports::set_verbose_log_level(int verbose) {
  FLAGS_v = verbose;
  LOG(INFO) << "Changed glog's FLAGS_v to " << verbose;
}
void DebuggingSupports::set_verbose_module(const std::string &module, int verbose) {
  // Watch out for this bug, if we get a crash here:
  // https://code.google.com/p/google-glog/issues/detail?id=172
  google::SetVLOGLevel(module.c_str(), verbose);
  LOG(INFO) << "Invoked google::SetVLOGLevel for " << module << ", level=" << verbose;
}
int DebuggingSupports::get_verbose_log_level() {
  return FLAGS_v;
}

}  // namespace debugging
}  // namespace memento
