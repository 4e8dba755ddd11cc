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
#include <glog/logging.h>
#include <memento/fs/filesystem.hpp>
#include <memento/fs/path.hpp>
#include <memento/util/inspect_cache.hpp>

#include <iostream>
#include <string>

/**
 * @file inspect_cache.cpp
 * @brief Cache Inspector Utility
 * @details
 * Lists entries under a cache root, verifies their success tokens and removes leftovers.
 */
DEFINE_string(function, "", "If specified, inspects only the entries of this function.");
DEFINE_bool(verbose, false, "Whether to list the files of each valid entry.");
DEFINE_bool(clean_staging, false, "Whether to remove staging directories. Make sure no process"
  " is computing in this cache root, or you will remove its work in progress.");
DEFINE_bool(remove_invalid, false, "Whether to remove published entries without success token.");

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("Cache Inspector Utility for libmemento\n"
    "  Lists entries under a cache root, verifies them and removes leftovers\n"
    "  Usage: memento_inspect <flags> <cache root>\n"
    "  Example: memento_inspect --verbose ~/memento_cache\n"
    "  Example2: memento_inspect --function=train --clean_staging ~/memento_cache");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc != 2) {
    std::cerr << "Specify exactly one cache root" << std::endl;
    return 1;
  }

  memento::util::InspectCache inspect;
  inspect.root_ = memento::fs::Path(std::string(argv[1]));
  inspect.function_ = FLAGS_function;
  inspect.verbose_ = FLAGS_verbose
    ? memento::util::InspectCache::kDetail
    : memento::util::InspectCache::kBrief;
  inspect.clean_staging_ = FLAGS_clean_staging;
  inspect.remove_invalid_ = FLAGS_remove_invalid;

  if (!memento::fs::is_directory(inspect.root_)) {
    std::cerr << "Not a directory: " << argv[1] << " (" << inspect.root_ << ")" << std::endl;
    return 1;
  }

  FLAGS_stderrthreshold = 2;
  FLAGS_minloglevel = 3;
  google::InitGoogleLogging(argv[0]);
  int ret = inspect.inspect_to_stdout();
  google::ShutdownGoogleLogging();
  return ret;
}
