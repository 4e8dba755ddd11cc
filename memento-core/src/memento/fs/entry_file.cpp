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
#include "memento/fs/entry_file.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <glog/logging.h>

#include <cerrno>
#include <ostream>
#include <string>

#include "memento/assert_nd.hpp"
#include "memento/assorted/assorted_func.hpp"
#include "memento/fs/filesystem.hpp"

namespace memento {
namespace fs {

EntryFile::EntryFile(const Path &path)
  : path_(path), descriptor_(kInvalidDescriptor), read_(false), write_(false),
    current_offset_(0) {
}

EntryFile::~EntryFile() {
  close();
}

ErrorCode EntryFile::open(bool read, bool write, bool create) {
  if (descriptor_ != kInvalidDescriptor) {
    LOG(ERROR) << "EntryFile::open(): already opened. this=" << *this;
    return kErrorCodeFsAlreadyOpened;
  }
  int oflags = O_CLOEXEC;
  if (read) {
    if (write) {
      oflags |= O_RDWR;
    } else {
      oflags |= O_RDONLY;
    }
  } else if (write) {
    oflags |= O_WRONLY;
  }
  if (create) {
    oflags |= O_CREAT | O_TRUNC;
  }
  mode_t permissions = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  descriptor_ = ::open(path_.c_str(), oflags, permissions);
  if (descriptor_ == kInvalidDescriptor) {
    // a missing file is an expected outcome for readers probing an entry. caller decides.
    VLOG(1) << "EntryFile::open(): failed to open: " << path_ << ". err=" << assorted::os_error();
    return kErrorCodeFsFailedToOpen;
  }
  read_ = read;
  write_ = write;
  current_offset_ = 0;
  VLOG(1) << "EntryFile::open(): successfully opened. " << *this;
  return kErrorCodeOk;
}

bool EntryFile::close() {
  if (descriptor_ != kInvalidDescriptor) {
    int ret = ::close(descriptor_);
    if (ret != 0) {
      // Error at file close is nasty, we can't do much. We just report it in log.
      LOG(ERROR) << "EntryFile::close(): error:" << assorted::os_error()
        << " file=" << *this << ".";
    }
    descriptor_ = kInvalidDescriptor;
    return ret == 0;
  }
  return false;
}

ErrorCode EntryFile::read_all(std::string* out) {
  out->clear();
  if (!is_opened()) {
    LOG(ERROR) << "File not opened yet, or closed. this=" << *this;
    return kErrorCodeFsNotOpened;
  }
  char buffer[1 << 12];
  while (true) {
    ssize_t read_bytes = ::read(descriptor_, buffer, sizeof(buffer));
    if (read_bytes < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "EntryFile::read_all(): error. this=" << *this
        << ", total_read=" << out->size() << ", err=" << assorted::os_error();
      return kErrorCodeFsTooShortRead;
    } else if (read_bytes == 0) {
      break;
    }
    out->append(buffer, read_bytes);
    current_offset_ += read_bytes;
  }
  return kErrorCodeOk;
}

ErrorCode EntryFile::write(const std::string& data) {
  if (!is_opened()) {
    LOG(ERROR) << "File not opened yet, or closed. this=" << *this;
    return kErrorCodeFsNotOpened;
  } else if (data.empty()) {
    return kErrorCodeOk;
  }

  // underlying POSIX filesystem might split the write for severel reasons. so, while loop.
  uint64_t total_written = 0;
  uint64_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written_bytes = ::write(descriptor_, data.data() + total_written, remaining);
    if (written_bytes < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "EntryFile::write(): error. this=" << *this
        << ", total_written=" << total_written << ", desired_bytes=" << data.size()
        << ", remaining=" << remaining << ", err=" << assorted::os_error();
      return kErrorCodeFsWriteFail;
    }
    ASSERT_ND(static_cast<uint64_t>(written_bytes) <= remaining);
    total_written += written_bytes;
    remaining -= written_bytes;
    current_offset_ += written_bytes;
  }
  return kErrorCodeOk;
}

ErrorCode EntryFile::sync() {
  if (!is_opened()) {
    return kErrorCodeFsNotOpened;
  }
  if (!is_write()) {
    return kErrorCodeInvalidParameter;
  }
  if (::fsync(descriptor_) != 0) {
    LOG(ERROR) << "EntryFile::sync(): fsync failed. this=" << *this
      << ", err=" << assorted::os_error();
    return kErrorCodeFsSyncFailed;
  }
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const EntryFile& v) {
  o << "<EntryFile>"
    << "<path>" << v.get_path() << "</path>"
    << "<descriptor>" << v.get_descriptor() << "</descriptor>"
    << "<read>" << v.is_read() << "</read>"
    << "<write>" << v.is_write() << "</write>"
    << "<current_offset>" << v.get_current_offset() << "</current_offset>"
    << "</EntryFile>";
  return o;
}

ErrorCode write_whole_file(const Path& path, const std::string& data, bool sync) {
  EntryFile file(path);
  CHECK_ERROR_CODE(file.open(false, true, true));
  CHECK_ERROR_CODE(file.write(data));
  if (sync) {
    CHECK_ERROR_CODE(file.sync());
  }
  if (!file.close()) {
    return kErrorCodeFsWriteFail;
  }
  return kErrorCodeOk;
}

ErrorCode read_whole_file(const Path& path, std::string* out) {
  EntryFile file(path);
  CHECK_ERROR_CODE(file.open(true, false, false));
  CHECK_ERROR_CODE(file.read_all(out));
  file.close();
  return kErrorCodeOk;
}

}  // namespace fs
}  // namespace memento
