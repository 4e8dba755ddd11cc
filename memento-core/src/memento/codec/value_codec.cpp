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
#include "memento/codec/value_codec.hpp"

#include <cstring>
#include <string>

namespace memento {
namespace codec {

void append_fixed(uint64_t value, uint16_t bytes, std::string* out) {
  for (uint16_t i = 0; i < bytes; ++i) {
    out->push_back(static_cast<char>((value >> (i * 8U)) & 0xFFU));
  }
}

ErrorCode extract_fixed(const std::string& in, size_t* pos, uint16_t bytes, uint64_t* value) {
  if (*pos > in.size() || in.size() - *pos < bytes) {
    return kErrorCodeCodecDecodeFailed;
  }
  uint64_t ret = 0;
  for (uint16_t i = 0; i < bytes; ++i) {
    uint64_t byte = static_cast<unsigned char>(in[*pos + i]);
    ret |= byte << (i * 8U);
  }
  *pos += bytes;
  *value = ret;
  return kErrorCodeOk;
}

void append_bytes(const std::string& value, std::string* out) {
  append_fixed(value.size(), sizeof(uint64_t), out);
  out->append(value);
}

ErrorCode extract_bytes(const std::string& in, size_t* pos, std::string* value) {
  uint64_t len;
  CHECK_ERROR_CODE(extract_fixed(in, pos, sizeof(uint64_t), &len));
  if (in.size() - *pos < len) {
    return kErrorCodeCodecDecodeFailed;
  }
  value->assign(in, *pos, len);
  *pos += len;
  return kErrorCodeOk;
}

ErrorCode ValueTraits<bool>::append(const bool& value, std::string* out) {
  out->push_back(value ? 1 : 0);
  return kErrorCodeOk;
}
ErrorCode ValueTraits<bool>::extract(const std::string& in, size_t* pos, bool* out) {
  uint64_t tmp;
  CHECK_ERROR_CODE(extract_fixed(in, pos, 1, &tmp));
  if (tmp > 1U) {
    return kErrorCodeCodecDecodeFailed;
  }
  *out = (tmp == 1U);
  return kErrorCodeOk;
}

ErrorCode ValueTraits<float>::append(const float& value, std::string* out) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  append_fixed(bits, sizeof(bits), out);
  return kErrorCodeOk;
}
ErrorCode ValueTraits<float>::extract(const std::string& in, size_t* pos, float* out) {
  uint64_t tmp;
  CHECK_ERROR_CODE(extract_fixed(in, pos, sizeof(uint32_t), &tmp));
  uint32_t bits = static_cast<uint32_t>(tmp);
  std::memcpy(out, &bits, sizeof(bits));
  return kErrorCodeOk;
}

ErrorCode ValueTraits<double>::append(const double& value, std::string* out) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  append_fixed(bits, sizeof(bits), out);
  return kErrorCodeOk;
}
ErrorCode ValueTraits<double>::extract(const std::string& in, size_t* pos, double* out) {
  uint64_t bits;
  CHECK_ERROR_CODE(extract_fixed(in, pos, sizeof(uint64_t), &bits));
  std::memcpy(out, &bits, sizeof(bits));
  return kErrorCodeOk;
}

}  // namespace codec
}  // namespace memento
