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
#include <gtest/gtest.h>
#include <stdint.h>

#include <sstream>
#include <string>

#include "memento/cached_function.hpp"
#include "memento/engine.hpp"
#include "memento/engine_options.hpp"
#include "memento/error_code.hpp"
#include "memento/error_stack.hpp"
#include "memento/initializable.hpp"
#include "memento/test_common.hpp"
#include "memento/entry/entry_paths.hpp"
#include "memento/fs/entry_file.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/fs/path.hpp"
#include "memento/signature/arguments.hpp"
#include "memento/signature/function_signature.hpp"
#include "memento/util/inspect_cache.hpp"

namespace memento {
namespace util {
DEFINE_TEST_CASE_PACKAGE(InspectCacheTest, memento.util);

/**
 * Populates a cache root with two valid "sum" entries, one entry without token,
 * one leaked staging directory and one stray file.
 */
fs::Path populate(const EngineOptions& options, fs::Path* incomplete, fs::Path* staging) {
  Engine engine(options);
  COERCE_ERROR(engine.initialize());
  UninitializeGuard guard(&engine);
  signature::FunctionSignature sig("sum");
  sig.add_input("x").add_input("y");
  CachedFunction<int32_t> sum(&engine, sig);
  COERCE_ERROR(sum.register_function());
  fs::Path entries[3];
  for (int32_t x = 0; x < 3; ++x) {
    signature::Arguments args;
    args.set("x", x).set("y", 1);
    CachedFunction<int32_t>::Body body = [x](
      const entry::OutputDirPaths&,
      int32_t* out) -> ErrorStack {
      *out = x + 1;
      return kRetOk;
    };
    CachedResult<int32_t> result;
    COERCE_ERROR(sum.call(args, body, &result));
    entries[x] = result.entry_path_;
  }
  EXPECT_TRUE(fs::remove(entries[2] / entry::EntryPaths::kSuccessTokenName));
  *incomplete = entries[2];

  *staging = fs::Path(entries[0].string() + ".staging_00000000ffffffff");
  EXPECT_TRUE(fs::create_directories(*staging));
  EXPECT_EQ(kErrorCodeOk,
    fs::write_whole_file(engine.get_cache_root() / "notes.txt", "hi", false));
  fs::Path root = engine.get_cache_root();
  COERCE_ERROR(engine.uninitialize());
  return root;
}

TEST(InspectCacheTest, ReportOnly) {
  EngineOptions options = get_tiny_options();
  fs::Path incomplete;
  fs::Path staging;
  fs::Path root = populate(options, &incomplete, &staging);

  InspectCache inspect;
  inspect.root_ = root;
  inspect.verbose_ = InspectCache::kDetail;
  std::stringstream out;
  COERCE_ERROR(inspect.inspect(&out));
  EXPECT_EQ(1U, inspect.result_functions_);
  EXPECT_EQ(2U, inspect.result_valid_entries_);
  EXPECT_EQ(1U, inspect.count_remaining(CacheFinding::kIncompleteEntry));
  EXPECT_EQ(1U, inspect.count_remaining(CacheFinding::kLeakedStaging));
  EXPECT_EQ(1U, inspect.count_remaining(CacheFinding::kNotDirectory));
  EXPECT_TRUE(fs::exists(incomplete));
  EXPECT_TRUE(fs::exists(staging));
  EXPECT_NE(std::string::npos, out.str().find("return_value.bin"));
  cleanup_test(options);
}

TEST(InspectCacheTest, Clean) {
  EngineOptions options = get_tiny_options();
  fs::Path incomplete;
  fs::Path staging;
  fs::Path root = populate(options, &incomplete, &staging);

  InspectCache inspect;
  inspect.root_ = root;
  inspect.clean_staging_ = true;
  inspect.remove_invalid_ = true;
  std::stringstream out;
  COERCE_ERROR(inspect.inspect(&out));
  EXPECT_EQ(2U, inspect.result_valid_entries_);
  EXPECT_EQ(0U, inspect.count_remaining(CacheFinding::kIncompleteEntry));
  EXPECT_EQ(0U, inspect.count_remaining(CacheFinding::kLeakedStaging));
  EXPECT_FALSE(fs::exists(incomplete));
  EXPECT_FALSE(fs::exists(staging));
  // never touches what it doesn't understand
  EXPECT_TRUE(fs::exists(root / "notes.txt"));

  // a second pass finds nothing to clean
  InspectCache again;
  again.root_ = root;
  COERCE_ERROR(again.inspect(&out));
  EXPECT_EQ(2U, again.result_valid_entries_);
  EXPECT_EQ(0U, again.count_remaining(CacheFinding::kIncompleteEntry));
  EXPECT_EQ(0U, again.count_remaining(CacheFinding::kLeakedStaging));
  cleanup_test(options);
}

TEST(InspectCacheTest, FunctionFilter) {
  EngineOptions options = get_tiny_options();
  fs::Path incomplete;
  fs::Path staging;
  fs::Path root = populate(options, &incomplete, &staging);

  InspectCache inspect;
  inspect.root_ = root;
  inspect.function_ = "train";
  std::stringstream out;
  COERCE_ERROR(inspect.inspect(&out));
  EXPECT_EQ(0U, inspect.result_functions_);
  EXPECT_EQ(0U, inspect.result_valid_entries_);
  EXPECT_TRUE(inspect.result_findings_.empty());
  cleanup_test(options);
}

TEST(InspectCacheTest, NoSuchRoot) {
  InspectCache inspect;
  inspect.root_ = fs::Path(std::string("tmp_inspect_") + get_random_name());
  std::stringstream out;
  EXPECT_EQ(kErrorCodeFsNotDirectory, inspect.inspect(&out).get_error_code());
}

}  // namespace util
}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(InspectCacheTest, memento.util);
