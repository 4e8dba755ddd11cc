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

#include <map>
#include <string>
#include <vector>

#include "memento/error_code.hpp"
#include "memento/test_common.hpp"
#include "memento/codec/value_codec.hpp"
#include "memento/storage/storage_options.hpp"

namespace memento {
namespace codec {
DEFINE_TEST_CASE_PACKAGE(ValueCodecTest, memento.codec);

TEST(ValueCodecTest, IntegerLayout) {
  std::string blob;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<int32_t>::encode(0x01020304, &blob));
  ASSERT_EQ(4U, blob.size());
  EXPECT_EQ(0x04, blob[0]);  // little endian
  EXPECT_EQ(0x01, blob[3]);

  int32_t value = 0;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<int32_t>::decode(blob, &value));
  EXPECT_EQ(0x01020304, value);

  int16_t negative = 0;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<int16_t>::encode(-5, &blob));
  EXPECT_EQ(2U, blob.size());
  EXPECT_EQ(kErrorCodeOk, ValueCodec<int16_t>::decode(blob, &negative));
  EXPECT_EQ(-5, negative);
}

TEST(ValueCodecTest, TruncatedOrPadded) {
  std::string blob;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<int64_t>::encode(1234567890123LL, &blob));
  int64_t value;
  EXPECT_EQ(kErrorCodeCodecDecodeFailed, ValueCodec<int64_t>::decode(blob.substr(0, 5), &value));
  EXPECT_EQ(kErrorCodeCodecDecodeFailed, ValueCodec<int64_t>::decode(blob + "x", &value));
  EXPECT_EQ(kErrorCodeCodecDecodeFailed, ValueCodec<int64_t>::decode("", &value));
}

TEST(ValueCodecTest, BrokenBool) {
  bool value;
  EXPECT_EQ(kErrorCodeCodecDecodeFailed, ValueCodec<bool>::decode(std::string(1, '\x07'), &value));
}

TEST(ValueCodecTest, DoubleBitExact) {
  std::string blob;
  const double tiny = 4.9406564584124654e-324;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<double>::encode(tiny, &blob));
  EXPECT_EQ(8U, blob.size());
  double value = 0;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<double>::decode(blob, &value));
  EXPECT_EQ(tiny, value);
}

TEST(ValueCodecTest, StringWithZeros) {
  std::string original("a\0b\0", 4);
  std::string blob;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<std::string>::encode(original, &blob));
  EXPECT_EQ(12U, blob.size());
  std::string value;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<std::string>::decode(blob, &value));
  EXPECT_EQ(original, value);

  // a length prefix larger than the rest
  EXPECT_EQ(kErrorCodeCodecDecodeFailed,
    ValueCodec<std::string>::decode(blob.substr(0, blob.size() - 1), &value));
}

TEST(ValueCodecTest, VectorOfBool) {
  std::vector<bool> original;
  original.push_back(true);
  original.push_back(false);
  original.push_back(true);
  std::string blob;
  EXPECT_EQ(kErrorCodeOk, ValueCodec< std::vector<bool> >::encode(original, &blob));
  EXPECT_EQ(8U + 3U, blob.size());
  std::vector<bool> value;
  EXPECT_EQ(kErrorCodeOk, ValueCodec< std::vector<bool> >::decode(blob, &value));
  EXPECT_EQ(original, value);
}

TEST(ValueCodecTest, HugeCount) {
  // count says 2^40 elements but there are none
  std::string blob;
  append_fixed(1ULL << 40, 8, &blob);
  std::vector<int32_t> value;
  EXPECT_EQ(kErrorCodeCodecDecodeFailed, ValueCodec< std::vector<int32_t> >::decode(blob, &value));
}

TEST(ValueCodecTest, NestedMap) {
  std::map<std::string, std::vector<std::string> > original;
  original["genes"].push_back("CD4");
  original["genes"].push_back("CD8A");
  original["cells"];
  std::string blob;
  typedef ValueCodec< std::map<std::string, std::vector<std::string> > > Codec;
  EXPECT_EQ(kErrorCodeOk, Codec::encode(original, &blob));
  std::map<std::string, std::vector<std::string> > value;
  EXPECT_EQ(kErrorCodeOk, Codec::decode(blob, &value));
  EXPECT_EQ(original, value);
}

TEST(ValueCodecTest, NoReturnValue) {
  EXPECT_FALSE(ValueCodec<NoReturnValue>::has_value());
  EXPECT_TRUE(ValueCodec<int32_t>::has_value());
  std::string blob("garbage");
  EXPECT_EQ(kErrorCodeOk, ValueCodec<NoReturnValue>::encode(NoReturnValue(), &blob));
  EXPECT_TRUE(blob.empty());
  NoReturnValue value;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<NoReturnValue>::decode("", &value));
}

TEST(ValueCodecTest, Externalizable) {
  storage::StorageOptions original;
  original.cache_root_ = "/data/cache";
  original.durable_commit_ = false;
  std::string blob;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<storage::StorageOptions>::encode(original, &blob));
  storage::StorageOptions value;
  EXPECT_EQ(kErrorCodeOk, ValueCodec<storage::StorageOptions>::decode(blob, &value));
  EXPECT_EQ("/data/cache", value.cache_root_);
  EXPECT_FALSE(value.durable_commit_);

  std::string broken;
  append_bytes("<StorageOptions></StorageOptions>", &broken);  // no cache_root_
  EXPECT_EQ(kErrorCodeCodecDecodeFailed,
    ValueCodec<storage::StorageOptions>::decode(broken, &value));
}

}  // namespace codec
}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(ValueCodecTest, memento.codec);
