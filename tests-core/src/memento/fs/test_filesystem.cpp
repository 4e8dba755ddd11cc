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
#include <errno.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "memento/error_code.hpp"
#include "memento/test_common.hpp"
#include "memento/fs/entry_file.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/fs/path.hpp"

/**
 * @file test_filesystem.cpp
 * Testcases for the filesystem functions the commit protocol relies on.
 */
namespace memento {
namespace fs {
DEFINE_TEST_CASE_PACKAGE(FilesystemTest, memento.fs);

Path make_test_folder() {
  Path folder(std::string("tmp_fs_") + get_random_name());
  EXPECT_TRUE(create_directories(folder));
  return folder;
}

TEST(FilesystemTest, PathIsAbsolute) {
  Path path("relative/to/here");
  EXPECT_EQ('/', path.string()[0]);
  EXPECT_EQ("here", path.filename());
  EXPECT_EQ("to", path.parent_path().filename());
}

TEST(FilesystemTest, WriteReadWholeFile) {
  Path folder = make_test_folder();
  Path file = folder / "data.bin";
  std::string data("abc\0def", 7);
  EXPECT_EQ(kErrorCodeOk, write_whole_file(file, data, true));
  EXPECT_TRUE(is_regular_file(file));
  EXPECT_EQ(7U, file_size(file));
  std::string read;
  EXPECT_EQ(kErrorCodeOk, read_whole_file(file, &read));
  EXPECT_EQ(data, read);

  // overwriting truncates
  EXPECT_EQ(kErrorCodeOk, write_whole_file(file, "x", false));
  EXPECT_EQ(kErrorCodeOk, read_whole_file(file, &read));
  EXPECT_EQ("x", read);
  remove_all(folder);
}

TEST(FilesystemTest, ReadMissingFile) {
  Path folder = make_test_folder();
  std::string read;
  EXPECT_EQ(kErrorCodeFsFailedToOpen, read_whole_file(folder / "nothing", &read));
  remove_all(folder);
}

TEST(FilesystemTest, EntryFileNotOpened) {
  Path folder = make_test_folder();
  EntryFile file(folder / "a");
  EXPECT_FALSE(file.is_opened());
  EXPECT_EQ(kErrorCodeFsNotOpened, file.write("abc"));
  EXPECT_EQ(kErrorCodeOk, file.open(false, true, true));
  EXPECT_EQ(kErrorCodeFsAlreadyOpened, file.open(false, true, true));
  EXPECT_TRUE(file.close());
  remove_all(folder);
}

TEST(FilesystemTest, RenameNoReplace) {
  Path folder = make_test_folder();
  Path staging = folder / "entry.staging_1";
  Path published = folder / "entry";
  EXPECT_TRUE(create_directories(staging));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(staging / "success_token", "SUCCESS\n", false));
  EXPECT_TRUE(atomic_rename_noreplace(staging, published));
  EXPECT_FALSE(exists(staging));
  EXPECT_TRUE(is_regular_file(published / "success_token"));
  remove_all(folder);
}

TEST(FilesystemTest, RenameNoReplaceExisting) {
  Path folder = make_test_folder();
  Path staging = folder / "entry.staging_2";
  Path published = folder / "entry";
  EXPECT_TRUE(create_directories(staging));
  EXPECT_TRUE(create_directories(published));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(staging / "return_value.bin", "new", false));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(published / "return_value.bin", "old", false));

  EXPECT_FALSE(atomic_rename_noreplace(staging, published));
  EXPECT_EQ(EEXIST, errno);
  std::string read;
  EXPECT_EQ(kErrorCodeOk, read_whole_file(published / "return_value.bin", &read));
  EXPECT_EQ("old", read);
  EXPECT_TRUE(exists(staging));
  remove_all(folder);
}

TEST(FilesystemTest, FsyncTree) {
  Path folder = make_test_folder();
  EXPECT_TRUE(create_directories(folder / "a" / "b"));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(folder / "a" / "b" / "c", "c", false));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(folder / "a" / "d", "d", false));
  EXPECT_TRUE(fsync_tree(folder));
  EXPECT_FALSE(fsync_tree(folder / "not_exist"));
  // neither a loop back to an ancestor nor a dangling link breaks it
  ASSERT_EQ(0, ::symlink(folder.c_str(), (folder / "a" / "loop").c_str()));
  ASSERT_EQ(0, ::symlink((folder / "nowhere").c_str(), (folder / "a" / "dangling").c_str()));
  EXPECT_TRUE(fsync_tree(folder));
  remove_all(folder);
}

TEST(FilesystemTest, RemoveAll) {
  Path folder = make_test_folder();
  EXPECT_TRUE(create_directories(folder / "a" / "b"));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(folder / "a" / "b" / "c", "c", false));
  EXPECT_EQ(4U, remove_all(folder));
  EXPECT_FALSE(exists(folder));
}

TEST(FilesystemTest, RemoveAllKeepsSymlinkTarget) {
  Path folder = make_test_folder();
  Path outside = folder / "outside";
  Path doomed = folder / "doomed";
  EXPECT_TRUE(create_directories(outside));
  EXPECT_TRUE(create_directories(doomed));
  EXPECT_EQ(kErrorCodeOk, write_whole_file(outside / "keep", "keep", false));
  ASSERT_EQ(0, ::symlink(outside.c_str(), (doomed / "dir_link").c_str()));
  ASSERT_EQ(0, ::symlink((outside / "keep").c_str(), (doomed / "file_link").c_str()));
  EXPECT_TRUE(is_symlink(doomed / "dir_link"));
  EXPECT_FALSE(is_symlink(outside));
  EXPECT_TRUE(is_directory(doomed / "dir_link"));
  EXPECT_FALSE(symlink_status(doomed / "dir_link").is_directory());

  EXPECT_EQ(3U, remove_all(doomed));
  EXPECT_FALSE(exists(doomed));
  EXPECT_TRUE(is_regular_file(outside / "keep"));
  // a dangling link is removed as well
  ASSERT_EQ(0, ::symlink((folder / "nowhere").c_str(), (folder / "dangling").c_str()));
  EXPECT_FALSE(exists(folder / "dangling"));
  EXPECT_TRUE(symlink_status(folder / "dangling").exists());
  EXPECT_TRUE(remove(folder / "dangling"));
  EXPECT_FALSE(symlink_status(folder / "dangling").exists());
  remove_all(folder);
}

TEST(FilesystemTest, UniqueName) {
  std::string name = unique_name("%%%%_%%%%", 0);
  EXPECT_EQ(9U, name.size());
  EXPECT_EQ('_', name[4]);
  for (size_t i = 0; i < name.size(); ++i) {
    if (i != 4) {
      EXPECT_TRUE((name[i] >= '0' && name[i] <= '9') || (name[i] >= 'a' && name[i] <= 'f'));
    }
  }
}

}  // namespace fs
}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(FilesystemTest, memento.fs);
