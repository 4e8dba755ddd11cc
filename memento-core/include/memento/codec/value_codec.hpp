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
#ifndef MEMENTO_CODEC_VALUE_CODEC_HPP_
#define MEMENTO_CODEC_VALUE_CODEC_HPP_

#include <stdint.h>

#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include "memento/error_code.hpp"
#include "memento/externalize/externalizable.hpp"

namespace memento {
namespace codec {
/**
 * @brief Return type of a cached function that returns nothing.
 * @ingroup CODEC
 */
struct NoReturnValue {
  bool operator==(const NoReturnValue& /*other*/) const { return true; }
};

/** Appends the lowest bytes of value in little-endian. */
void      append_fixed(uint64_t value, uint16_t bytes, std::string* out);
/** Reads what append_fixed() wrote and advances pos. */
ErrorCode extract_fixed(const std::string& in, size_t* pos, uint16_t bytes, uint64_t* value);
/** Appends 8-byte length and the raw bytes. */
void      append_bytes(const std::string& value, std::string* out);
/** Reads what append_bytes() wrote and advances pos. */
ErrorCode extract_bytes(const std::string& in, size_t* pos, std::string* value);

/**
 * @brief Per-type serialization used by ValueCodec.
 * @ingroup CODEC
 * @details
 * Each specialization provides
 * @code{.cpp}
 * static ErrorCode append(const T& value, std::string* out);
 * static ErrorCode extract(const std::string& in, size_t* pos, T* out);
 * @endcode
 * append() adds to the end of out. extract() reads from in at *pos and advances *pos.
 * The second template parameter is for enable_if based specializations.
 */
template <typename T, typename ENABLE = void>
struct ValueTraits;

/** Integers other than bool, with their own width. */
template <typename T>
struct ValueTraits<T, typename std::enable_if<
  std::is_integral<T>::value && !std::is_same<T, bool>::value>::type> {
  static ErrorCode append(const T& value, std::string* out) {
    append_fixed(static_cast<uint64_t>(value), sizeof(T), out);
    return kErrorCodeOk;
  }
  static ErrorCode extract(const std::string& in, size_t* pos, T* out) {
    uint64_t tmp;
    CHECK_ERROR_CODE(extract_fixed(in, pos, sizeof(T), &tmp));
    *out = static_cast<T>(tmp);
    return kErrorCodeOk;
  }
};

template <>
struct ValueTraits<bool> {
  static ErrorCode append(const bool& value, std::string* out);
  static ErrorCode extract(const std::string& in, size_t* pos, bool* out);
};

template <>
struct ValueTraits<float> {
  static ErrorCode append(const float& value, std::string* out);
  static ErrorCode extract(const std::string& in, size_t* pos, float* out);
};

template <>
struct ValueTraits<double> {
  static ErrorCode append(const double& value, std::string* out);
  static ErrorCode extract(const std::string& in, size_t* pos, double* out);
};

template <>
struct ValueTraits<std::string> {
  static ErrorCode append(const std::string& value, std::string* out) {
    append_bytes(value, out);
    return kErrorCodeOk;
  }
  static ErrorCode extract(const std::string& in, size_t* pos, std::string* out) {
    return extract_bytes(in, pos, out);
  }
};

template <>
struct ValueTraits<NoReturnValue> {
  static ErrorCode append(const NoReturnValue& /*value*/, std::string* /*out*/) {
    return kErrorCodeOk;
  }
  static ErrorCode extract(const std::string& /*in*/, size_t* /*pos*/, NoReturnValue* /*out*/) {
    return kErrorCodeOk;
  }
};

template <typename T>
struct ValueTraits< std::vector<T> > {
  static ErrorCode append(const std::vector<T>& value, std::string* out) {
    append_fixed(value.size(), sizeof(uint64_t), out);
    for (size_t i = 0; i < value.size(); ++i) {
      T element = value[i];  // vector<bool> gives a proxy, not a reference
      CHECK_ERROR_CODE(ValueTraits<T>::append(element, out));
    }
    return kErrorCodeOk;
  }
  static ErrorCode extract(const std::string& in, size_t* pos, std::vector<T>* out) {
    uint64_t count;
    CHECK_ERROR_CODE(extract_fixed(in, pos, sizeof(uint64_t), &count));
    // every element takes at least one byte except NoReturnValue, which nobody nests.
    if (count > in.size() - *pos) {
      return kErrorCodeCodecDecodeFailed;
    }
    out->clear();
    out->reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
      T element;
      CHECK_ERROR_CODE(ValueTraits<T>::extract(in, pos, &element));
      out->push_back(element);
    }
    return kErrorCodeOk;
  }
};

/** Keys in map order, so equal maps encode to equal bytes. */
template <typename T>
struct ValueTraits< std::map<std::string, T> > {
  static ErrorCode append(const std::map<std::string, T>& value, std::string* out) {
    append_fixed(value.size(), sizeof(uint64_t), out);
    for (const auto& pair : value) {
      append_bytes(pair.first, out);
      CHECK_ERROR_CODE(ValueTraits<T>::append(pair.second, out));
    }
    return kErrorCodeOk;
  }
  static ErrorCode extract(const std::string& in, size_t* pos, std::map<std::string, T>* out) {
    uint64_t count;
    CHECK_ERROR_CODE(extract_fixed(in, pos, sizeof(uint64_t), &count));
    if (count > in.size() - *pos) {
      return kErrorCodeCodecDecodeFailed;
    }
    out->clear();
    for (uint64_t i = 0; i < count; ++i) {
      std::string key;
      CHECK_ERROR_CODE(extract_bytes(in, pos, &key));
      T element;
      CHECK_ERROR_CODE(ValueTraits<T>::extract(in, pos, &element));
      (*out)[key] = element;
    }
    return kErrorCodeOk;
  }
};

/** Externalizable objects as their XML text. */
template <typename T>
struct ValueTraits<T, typename std::enable_if<
  std::is_base_of<externalize::Externalizable, T>::value>::type> {
  static ErrorCode append(const T& value, std::string* out) {
    std::string xml;
    UNWRAP_ERROR_STACK(value.save_to_string(&xml));
    append_bytes(xml, out);
    return kErrorCodeOk;
  }
  static ErrorCode extract(const std::string& in, size_t* pos, T* out) {
    std::string xml;
    CHECK_ERROR_CODE(extract_bytes(in, pos, &xml));
    ErrorStack load_error = out->load_from_string(xml);
    if (load_error.is_error()) {
      return kErrorCodeCodecDecodeFailed;
    }
    return kErrorCodeOk;
  }
};

/**
 * @brief Encodes and decodes a whole return value.
 * @ingroup CODEC
 * @details
 * decode() requires that the value consumes every byte, so a truncated or padded
 * return_value.bin is reported as kErrorCodeCodecDecodeFailed rather than silently accepted.
 */
template <typename T>
struct ValueCodec {
  /** Whether a function returning T stores return_value.bin at all. */
  static bool has_value() { return !std::is_same<T, NoReturnValue>::value; }

  static ErrorCode encode(const T& value, std::string* out) {
    out->clear();
    ErrorCode code = ValueTraits<T>::append(value, out);
    if (code != kErrorCodeOk) {
      return kErrorCodeCodecEncodeFailed;
    }
    return kErrorCodeOk;
  }

  static ErrorCode decode(const std::string& in, T* out) {
    size_t pos = 0;
    ErrorCode code = ValueTraits<T>::extract(in, &pos, out);
    if (code != kErrorCodeOk || pos != in.size()) {
      return kErrorCodeCodecDecodeFailed;
    }
    return kErrorCodeOk;
  }
};

}  // namespace codec
}  // namespace memento
#endif  // MEMENTO_CODEC_VALUE_CODEC_HPP_
