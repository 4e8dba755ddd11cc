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
#ifndef MEMENTO_FS_ENTRY_FILE_HPP_
#define MEMENTO_FS_ENTRY_FILE_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "memento/error_code.hpp"
#include "memento/fs/path.hpp"

namespace memento {
namespace fs {

/**
 * @brief Represents an I/O stream on one small file in a cache entry.
 * @ingroup FILESYSTEM
 * @details
 * Return values and success tokens are small and written exactly once, so unlike a log file
 * we go through the page cache and rely on fsync() where durability matters.
 * All methods report errors as ErrorCode and leave the details (errno, path) in the debug log.
 */
class EntryFile {
 public:
  /** Represents low-level file descriptor. */
  typedef int file_descriptor;
  /** Constant values. */
  enum Constants {
    /** POSIX open() semantics says -1 is invalid or not-yet-opened. */
    kInvalidDescriptor = -1,
  };

  /** Constructs this object without opening it yet. */
  explicit EntryFile(const Path &path);

  /** Automatically closes the file if it is opened. */
  ~EntryFile();

  EntryFile() = delete;
  EntryFile(const EntryFile &) = delete;
  EntryFile& operator=(const EntryFile &) = delete;

  /**
   * @brief Tries to open the file.
   * @param[in] read whether to allow read accesses on the opened file
   * @param[in] write whether to allow write accesses on the opened file
   * @param[in] create whether to create the file. if it already exists, it is truncated.
   */
  ErrorCode       open(bool read, bool write, bool create);

  /** Whether the file is already and successfully opened.*/
  bool            is_opened() const { return descriptor_ != kInvalidDescriptor; }

  /**
   * @brief Close the file if not yet closed.
   * @return Whether successfully closed.
   */
  bool            close();

  /**
   * @brief Reads the whole remaining content of the file into the given string.
   * @pre is_opened()
   */
  ErrorCode       read_all(std::string* out);

  /**
   * @brief Sequentially writes the given bytes from the current position.
   * @pre is_opened()
   */
  ErrorCode       write(const std::string& data);

  /**
   * @brief Analogues of POSIX fsync().
   * @pre is_opened()
   * @pre is_write()
   */
  ErrorCode       sync();

  const Path&             get_path() const { return path_; }
  file_descriptor         get_descriptor() const { return descriptor_; }
  uint64_t                get_current_offset() const { return current_offset_; }
  bool                    is_read() const { return read_; }
  bool                    is_write() const { return write_; }

  friend std::ostream&    operator<<(std::ostream& o, const EntryFile& v);

 private:
  const Path      path_;
  file_descriptor descriptor_;
  bool            read_;
  bool            write_;
  uint64_t        current_offset_;
};

/**
 * @brief Writes the given content to a new file in one shot, optionally with fsync.
 * @ingroup FILESYSTEM
 */
ErrorCode write_whole_file(const Path& path, const std::string& data, bool sync);

/**
 * @brief Reads the whole content of a regular file.
 * @ingroup FILESYSTEM
 */
ErrorCode read_whole_file(const Path& path, std::string* out);

}  // namespace fs
}  // namespace memento
#endif  // MEMENTO_FS_ENTRY_FILE_HPP_
