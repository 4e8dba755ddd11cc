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
#include <glog/logging.h>
#include <gtest/gtest.h>
#include <stdint.h>

#include <iostream>
#include <string>

#include "memento/engine.hpp"
#include "memento/engine_options.hpp"
#include "memento/initializable.hpp"
#include "memento/test_common.hpp"
#include "memento/debugging/debugging_options.hpp"
#include "memento/debugging/debugging_supports.hpp"
#include "memento/debugging/stop_watch.hpp"

namespace memento {
namespace debugging {
DEFINE_TEST_CASE_PACKAGE(DebuggingOptionsTest, memento.debugging);

TEST(DebuggingOptionsTest, Defaults) {
  DebuggingOptions options;
  EXPECT_EQ(DebuggingOptions::kDebugLogInfo, options.debug_log_stderr_threshold_);
  EXPECT_EQ(DebuggingOptions::kDebugLogInfo, options.debug_log_min_threshold_);
  EXPECT_EQ(0, options.verbose_log_level_);
}

TEST(DebuggingOptionsTest, ChangeVerboseLevel) {
  EngineOptions options = get_tiny_options();
  Engine engine(options);
  COERCE_ERROR(engine.initialize());
  {
    UninitializeGuard guard(&engine);
    EXPECT_EQ(1, DebuggingSupports::get_verbose_log_level());
    engine.get_debug()->set_verbose_log_level(2);
    EXPECT_EQ(2, DebuggingSupports::get_verbose_log_level());
    engine.get_debug()->set_verbose_module("engine_pimpl", 0);
    engine.get_debug()->set_verbose_log_level(1);
    COERCE_ERROR(engine.uninitialize());
  }
  cleanup_test(options);
}

TEST(DebuggingOptionsTest, TwoEngines) {
  EngineOptions options = get_tiny_options();
  EngineOptions options2 = get_tiny_options();
  Engine engine(options);
  Engine engine2(options2);
  COERCE_ERROR(engine.initialize());
  COERCE_ERROR(engine2.initialize());
  // glog stays usable until the last engine is gone
  COERCE_ERROR(engine.uninitialize());
  LOG(INFO) << "engine2 still logs";
  COERCE_ERROR(engine2.uninitialize());
  cleanup_test(options);
  cleanup_test(options2);
}

TEST(DebuggingOptionsTest, StopWatch) {
  StopWatch watch;
  uint64_t peeked = watch.peek_elapsed_ns();
  uint64_t elapsed = watch.stop();
  EXPECT_GE(elapsed, peeked);
  EXPECT_EQ(elapsed, watch.elapsed_ns());
  EXPECT_DOUBLE_EQ(static_cast<double>(elapsed) / 1000.0, watch.elapsed_us());
}

}  // namespace debugging
}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(DebuggingOptionsTest, memento.debugging);
