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
#include <stdint.h>
#include <sys/wait.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "memento/cached_function.hpp"
#include "memento/engine.hpp"
#include "memento/engine_options.hpp"
#include "memento/error_stack.hpp"
#include "memento/debugging/stop_watch.hpp"
#include "memento/signature/arguments.hpp"
#include "memento/signature/function_signature.hpp"

/**
 * @file warmup_cache.cpp
 * @brief Fills a cache root from several processes at once.
 * @details
 * Each process computes its share of sum(x, y) for x, y in [1, grid]. verbose is excluded from
 * the key and z only counts when it differs from its default, so a second run with
 * --verbose or --z=0 is all hits.
 */
DEFINE_string(cache_root, "/tmp/memento_warmup", "Cache root to fill.");
DEFINE_int32(processes, 4, "Number of processes to fork.");
DEFINE_int32(grid, 10, "x and y take values 1 to grid.");
DEFINE_bool(verbose, false, "Passed to sum(). Excluded from the key.");
DEFINE_int32(z, 0, "Passed to sum(). Excluded from the key while it is 0.");

memento::signature::FunctionSignature make_sum_signature() {
  memento::signature::FunctionSignature sig("sum");
  sig.add_input("x").add_input("y").add_input("verbose", false).add_input("z", 0);
  sig.exclude("verbose").exclude_if_default("z");
  return sig;
}

memento::ErrorStack process_main_impl(int process_index, uint32_t* hits, uint32_t* misses) {
  memento::EngineOptions options;
  options.storage_.cache_root_ = FLAGS_cache_root;
  memento::Engine engine(options);
  CHECK_ERROR(engine.initialize());
  memento::UninitializeGuard guard(&engine);

  memento::CachedFunction<int32_t> sum(&engine, make_sum_signature());
  CHECK_ERROR(sum.register_function());
  int32_t index = 0;
  for (int32_t x = 1; x <= FLAGS_grid; ++x) {
    for (int32_t y = 1; y <= FLAGS_grid; ++y, ++index) {
      if (index % FLAGS_processes != process_index) {
        continue;
      }
      const bool verbose = FLAGS_verbose;
      const int32_t z = FLAGS_z;
      memento::signature::Arguments args;
      args.set("x", x).set("y", y).set("verbose", verbose).set("z", z);
      memento::CachedResult<int32_t> result;
      CHECK_ERROR(sum.call(
        args,
        [x, y, z, verbose](const memento::entry::OutputDirPaths& /*dirs*/, int32_t* out)
          -> memento::ErrorStack {
          if (verbose) {
            std::cout << "Adding up " << x << ", " << y << ", and " << z << std::endl;
          }
          *out = x + y + z;
          return memento::kRetOk;
        },
        &result));
      if (result.return_value_ != x + y + z) {
        return ERROR_STACK_MSG(memento::kErrorCodeComputationFailed, "wrong sum in cache");
      }
      if (result.hit_) {
        ++(*hits);
      } else {
        ++(*misses);
      }
    }
  }
  CHECK_ERROR(engine.uninitialize());
  return memento::kRetOk;
}

int process_main(int process_index) {
  uint32_t hits = 0;
  uint32_t misses = 0;
  memento::debugging::StopWatch watch;
  memento::ErrorStack error = process_main_impl(process_index, &hits, &misses);
  watch.stop();
  if (error.is_error()) {
    std::cerr << "Process-" << process_index << " failed: " << error << std::endl;
    return 1;
  }
  std::cout << "Process-" << process_index << " (pid-" << ::getpid() << ") done in "
    << watch.elapsed_ms() << " ms. hits=" << hits << ", misses=" << misses << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  gflags::SetUsageMessage("Fills a memento cache root from several processes");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (FLAGS_processes <= 0 || FLAGS_grid <= 0) {
    std::cerr << "--processes and --grid must be positive" << std::endl;
    return 1;
  }

  std::vector<pid_t> pids;
  for (int i = 0; i < FLAGS_processes; ++i) {
    pid_t pid = ::fork();
    if (pid == -1) {
      std::cerr << "fork() failed" << std::endl;
      return 1;
    } else if (pid == 0) {
      ::_exit(process_main(i));
    }
    pids.push_back(pid);
  }

  int failures = 0;
  for (pid_t pid : pids) {
    int status;
    ::waitpid(pid, &status, 0);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
      ++failures;
    }
  }
  std::cout << "All processes ended. failures=" << failures << std::endl;
  return failures == 0 ? 0 : 1;
}
