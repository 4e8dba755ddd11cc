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
#include <unistd.h>

#include <string>

#include "memento/error_code.hpp"
#include "memento/error_stack.hpp"
#include "memento/test_common.hpp"
#include "memento/entry/entry_committer.hpp"
#include "memento/entry/entry_paths.hpp"
#include "memento/entry/entry_state.hpp"
#include "memento/entry/output_materializer.hpp"
#include "memento/fs/entry_file.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/fs/path.hpp"
#include "memento/signature/function_signature.hpp"
#include "memento/storage/local_storage_backend.hpp"

namespace memento {
namespace entry {
DEFINE_TEST_CASE_PACKAGE(EntryCommitterTest, memento.entry);

const char* kKey = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef"
                   "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";

struct TestRoot {
  TestRoot() : root_(std::string("tmp_entry_") + get_random_name()) {}
  ~TestRoot() { fs::remove_all(root_); }
  fs::Path root_;
};

TEST(EntryCommitterTest, Paths) {
  fs::Path root("/cache");
  EntryPaths paths(root, "sum", kKey);
  EXPECT_EQ(std::string("/cache/sum"), paths.get_function_dir().string());
  EXPECT_EQ(std::string("/cache/sum/") + kKey, paths.get_published_path().string());
  EXPECT_TRUE(EntryPaths::is_staging_name(paths.get_staging_path().filename()));
  EXPECT_FALSE(EntryPaths::is_staging_name(paths.get_published_path().filename()));
  EXPECT_EQ(paths.get_function_dir(), paths.get_staging_path().parent_path());

  // every attempt gets its own staging directory
  EntryPaths paths2(root, "sum", kKey);
  EXPECT_NE(paths.get_staging_path(), paths2.get_staging_path());
  EXPECT_EQ(paths.get_published_path(), paths2.get_published_path());
}

TEST(EntryCommitterTest, CommitAndRead) {
  TestRoot test;
  storage::LocalStorageBackend backend(true);
  EntryCommitter committer(&backend, true);
  EntryPaths paths(test.root_, "sum", kKey);
  std::string blob;
  EXPECT_EQ(kEntryAbsent, committer.read_published(paths, true, &blob));

  COERCE_ERROR(committer.prepare_staging(paths));
  EXPECT_TRUE(fs::is_directory(paths.get_staging_path()));
  // not visible until published
  EXPECT_EQ(kEntryAbsent, committer.read_published(paths, true, &blob));

  COERCE_ERROR(committer.commit(paths, true, "value"));
  EXPECT_FALSE(fs::exists(paths.get_staging_path()));
  EXPECT_EQ(kEntryValid, committer.read_published(paths, true, &blob));
  EXPECT_EQ("value", blob);

  std::string token;
  EXPECT_EQ(kErrorCodeOk, fs::read_whole_file(paths.get_published_token_path(), &token));
  EXPECT_EQ(EntryPaths::kSuccessTokenContent, token);
}

TEST(EntryCommitterTest, NoReturnValue) {
  TestRoot test;
  storage::LocalStorageBackend backend(false);
  EntryCommitter committer(&backend, false);
  EntryPaths paths(test.root_, "fit", kKey);
  COERCE_ERROR(committer.prepare_staging(paths));
  COERCE_ERROR(committer.commit(paths, false, ""));
  EXPECT_FALSE(fs::exists(paths.get_published_return_value_path()));
  std::string blob;
  EXPECT_EQ(kEntryValid, committer.read_published(paths, false, &blob));
  // a reader that expects a return value sees it as corrupt
  EXPECT_EQ(kEntryCorrupt, committer.read_published(paths, true, &blob));
}

TEST(EntryCommitterTest, Conflict) {
  TestRoot test;
  storage::LocalStorageBackend backend(false);
  EntryCommitter committer(&backend, false);
  EntryPaths first(test.root_, "sum", kKey);
  EntryPaths second(test.root_, "sum", kKey);
  COERCE_ERROR(committer.prepare_staging(first));
  COERCE_ERROR(committer.prepare_staging(second));
  COERCE_ERROR(committer.commit(first, true, "first"));

  ErrorStack error = committer.commit(second, true, "second");
  EXPECT_EQ(kErrorCodeEntryConcurrentWriteConflict, error.get_error_code());
  // the loser's staging directory stays for the caller to discard
  EXPECT_TRUE(fs::exists(second.get_staging_path()));
  COERCE_ERROR(committer.discard_staging(second));
  EXPECT_FALSE(fs::exists(second.get_staging_path()));

  std::string blob;
  EXPECT_EQ(kEntryValid, committer.read_published(first, true, &blob));
  EXPECT_EQ("first", blob);
}

TEST(EntryCommitterTest, Incomplete) {
  TestRoot test;
  storage::LocalStorageBackend backend(false);
  EntryCommitter committer(&backend, false);
  EntryPaths paths(test.root_, "sum", kKey);
  // a published directory without token, as left by a crash in a non-atomic copy
  EXPECT_TRUE(fs::create_directories(paths.get_published_path()));
  EXPECT_EQ(kErrorCodeOk,
    fs::write_whole_file(paths.get_published_return_value_path(), "partial", false));
  std::string blob;
  EXPECT_EQ(kEntryIncomplete, committer.read_published(paths, true, &blob));

  COERCE_ERROR(committer.discard_published(paths));
  EXPECT_EQ(kEntryAbsent, committer.read_published(paths, true, &blob));
  // discarding twice is fine
  COERCE_ERROR(committer.discard_published(paths));
}

TEST(EntryCommitterTest, MissingReturnValue) {
  TestRoot test;
  storage::LocalStorageBackend backend(false);
  EntryCommitter committer(&backend, false);
  EntryPaths paths(test.root_, "sum", kKey);
  COERCE_ERROR(committer.prepare_staging(paths));
  COERCE_ERROR(committer.commit(paths, true, "value"));
  EXPECT_TRUE(fs::remove(paths.get_published_return_value_path()));
  std::string blob;
  EXPECT_EQ(kEntryCorrupt, committer.read_published(paths, true, &blob));
}

TEST(EntryCommitterTest, MaterializeOutputDirectories) {
  TestRoot test;
  storage::LocalStorageBackend backend(false);
  EntryCommitter committer(&backend, false);
  signature::FunctionSignature sig("train");
  sig.add_input("adata_path").add_output_directory("output_model_dir").add_output_directory("log");
  EntryPaths paths(test.root_, "train", kKey);
  COERCE_ERROR(committer.prepare_staging(paths));

  OutputDirPaths staging_dirs;
  COERCE_ERROR(OutputMaterializer::materialize(&backend, sig, paths.get_staging_path(),
                                               &staging_dirs));
  ASSERT_EQ(2U, staging_dirs.size());
  EXPECT_TRUE(fs::is_directory(staging_dirs["output_model_dir"]));
  EXPECT_EQ(kErrorCodeOk,
    fs::write_whole_file(staging_dirs["output_model_dir"] / "model.bin", "weights", false));
  COERCE_ERROR(committer.commit(paths, true, "0"));

  OutputDirPaths published_dirs = OutputMaterializer::resolve(sig, paths.get_published_path());
  EXPECT_EQ(paths.get_published_path() / "output_model_dir", published_dirs["output_model_dir"]);
  std::string model;
  EXPECT_EQ(kErrorCodeOk,
    fs::read_whole_file(published_dirs["output_model_dir"] / "model.bin", &model));
  EXPECT_EQ("weights", model);
  EXPECT_TRUE(fs::is_directory(published_dirs["log"]));
}

TEST(EntryCommitterTest, DiscardKeepsSymlinkTarget) {
  TestRoot test;
  storage::LocalStorageBackend backend(false);
  EntryCommitter committer(&backend, false);
  signature::FunctionSignature sig("train");
  sig.add_input("adata_path").add_output_directory("output_model_dir");
  fs::Path dataset = test.root_ / "dataset";
  ASSERT_TRUE(fs::create_directories(dataset));
  EXPECT_EQ(kErrorCodeOk, fs::write_whole_file(dataset / "precious.txt", "data", false));

  // a computation linking its input into the output directory, then failing
  EntryPaths failed(test.root_ / "cache", "train", kKey);
  COERCE_ERROR(committer.prepare_staging(failed));
  OutputDirPaths staging_dirs;
  COERCE_ERROR(OutputMaterializer::materialize(&backend, sig, failed.get_staging_path(),
                                               &staging_dirs));
  fs::Path link = staging_dirs["output_model_dir"] / "input_link";
  ASSERT_EQ(0, ::symlink(dataset.c_str(), link.c_str()));
  EXPECT_TRUE(fs::is_symlink(link));
  EXPECT_TRUE(fs::is_directory(link));
  COERCE_ERROR(committer.discard_staging(failed));
  EXPECT_FALSE(fs::exists(failed.get_staging_path()));
  EXPECT_TRUE(fs::is_regular_file(dataset / "precious.txt"));

  // same for a published entry being invalidated
  EntryPaths published(test.root_ / "cache", "train", kKey);
  COERCE_ERROR(committer.prepare_staging(published));
  COERCE_ERROR(OutputMaterializer::materialize(&backend, sig, published.get_staging_path(),
                                               &staging_dirs));
  link = staging_dirs["output_model_dir"] / "input_link";
  ASSERT_EQ(0, ::symlink(dataset.c_str(), link.c_str()));
  COERCE_ERROR(committer.commit(published, true, "0"));
  COERCE_ERROR(committer.discard_published(published));
  EXPECT_FALSE(fs::exists(published.get_published_path()));
  std::string content;
  EXPECT_EQ(kErrorCodeOk, fs::read_whole_file(dataset / "precious.txt", &content));
  EXPECT_EQ("data", content);
}

TEST(EntryCommitterTest, StateNames) {
  EXPECT_EQ(std::string("Hit"), to_string(kHit));
  EXPECT_EQ(std::string("Corrupt"), to_string(kEntryCorrupt));
}

}  // namespace entry
}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(EntryCommitterTest, memento.entry);
