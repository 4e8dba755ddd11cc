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
#include <gflags/gflags.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "memento/cached_function.hpp"
#include "memento/engine.hpp"
#include "memento/engine_options.hpp"
#include "memento/error_stack.hpp"
#include "memento/codec/value_codec.hpp"
#include "memento/debugging/stop_watch.hpp"
#include "memento/fs/entry_file.hpp"
#include "memento/signature/arguments.hpp"
#include "memento/signature/function_signature.hpp"

/**
 * @file cached_sum_output.cpp
 * @brief A cached computation whose only product is an output directory.
 * @details
 * The first call sleeps and writes result.txt, the second one reads it back immediately.
 */
DEFINE_string(cache_root, "/tmp/memento_output_dir", "Cache root.");
DEFINE_double(a, 1.0, "First operand.");
DEFINE_double(b, 2.0, "Second operand.");
DEFINE_int32(sleep_ms, 5000, "How long the computation pretends to work.");

memento::ErrorStack call_and_read(
  memento::CachedFunction<memento::codec::NoReturnValue>* cached_sum,
  std::string* content) {
  const double a = FLAGS_a;
  const double b = FLAGS_b;
  memento::CachedResult<memento::codec::NoReturnValue> result;
  memento::debugging::StopWatch watch;
  CHECK_ERROR(cached_sum->call(
    memento::signature::Arguments().set("a", a).set("b", b),
    [a, b](const memento::entry::OutputDirPaths& dirs, memento::codec::NoReturnValue* /*out*/)
      -> memento::ErrorStack {
      std::this_thread::sleep_for(std::chrono::milliseconds(FLAGS_sleep_ms));
      WRAP_ERROR_CODE(memento::fs::write_whole_file(
        dirs.at("output_dir") / "result.txt",
        memento::signature::to_canonical_string(a + b),
        false));
      return memento::kRetOk;
    },
    &result));
  watch.stop();
  WRAP_ERROR_CODE(memento::fs::read_whole_file(
    result.output_dirs_.at("output_dir") / "result.txt",
    content));
  std::cout << (result.hit_ ? "hit" : "miss") << " in " << watch.elapsed_ms() << " ms: "
    << result.output_dirs_.at("output_dir") << std::endl;
  return memento::kRetOk;
}

memento::ErrorStack main_impl() {
  memento::EngineOptions options;
  options.storage_.cache_root_ = FLAGS_cache_root;
  memento::Engine engine(options);
  CHECK_ERROR(engine.initialize());
  memento::UninitializeGuard guard(&engine);

  memento::signature::FunctionSignature sig("my_cached_sum");
  sig.add_input("a").add_input("b").add_output_directory("output_dir");
  memento::CachedFunction<memento::codec::NoReturnValue> cached_sum(&engine, sig);
  CHECK_ERROR(cached_sum.register_function());

  for (int i = 0; i < 2; ++i) {
    std::string content;
    CHECK_ERROR(call_and_read(&cached_sum, &content));
    std::cout << "res = " << content << std::endl;
  }
  CHECK_ERROR(engine.uninitialize());
  return memento::kRetOk;
}

int main(int argc, char **argv) {
  gflags::SetUsageMessage("Caches a computation that writes to an output directory");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  memento::ErrorStack error = main_impl();
  if (error.is_error()) {
    std::cerr << error << std::endl;
    return 1;
  }
  return 0;
}
