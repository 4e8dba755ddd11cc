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
#ifndef MEMENTO_CACHED_FUNCTION_HPP_
#define MEMENTO_CACHED_FUNCTION_HPP_

#include <functional>
#include <string>

#include "memento/computation.hpp"
#include "memento/engine.hpp"
#include "memento/error_stack.hpp"
#include "memento/codec/value_codec.hpp"
#include "memento/entry/output_materializer.hpp"
#include "memento/signature/arguments.hpp"
#include "memento/signature/function_signature.hpp"

namespace memento {
/**
 * @brief Typed result of a cached call.
 * @ingroup IDIOMS
 */
template <typename RESULT>
struct CachedResult {
  CachedResult() : return_value_(), hit_(false) {}

  RESULT                  return_value_;
  /** Output directories under the published entry of the current cache root. */
  entry::OutputDirPaths   output_dirs_;
  /** Whether the result came from an existing entry. */
  bool                    hit_;
  std::string             key_;
  fs::Path                entry_path_;
};

/**
 * @brief A function wrapped with memoization.
 * @ingroup IDIOMS
 * @details
 * RESULT is the return type, stored with codec::ValueCodec<RESULT>.
 * Use codec::NoReturnValue for a function that produces only output directories.
 * @code{.cpp}
 * signature::FunctionSignature sig("train");
 * sig.add_input("adata_path").add_input("n_hidden", 128).add_output_directory("output_model_dir");
 * CachedFunction<int> train(&engine, sig);
 * CHECK_ERROR(train.register_function());
 *
 * std::string adata_path("path/to/adata");
 * CachedResult<int> result;
 * CHECK_ERROR(train.call(
 *   signature::Arguments().set("adata_path", adata_path),
 *   [&](const entry::OutputDirPaths& dirs, int* out) {
 *     ... write the model under dirs.at("output_model_dir") ...
 *     *out = 42;
 *     return kRetOk;
 *   },
 *   &result));
 * @endcode
 * The body runs only on a miss. It must use the same argument values that the Arguments
 * object describes, otherwise the cache maps the call to someone else's result.
 */
template <typename RESULT>
class CachedFunction {
 public:
  /** The wrapped computation. Receives staging paths of the output directories. */
  typedef std::function< ErrorStack(const entry::OutputDirPaths& output_dirs,
                                    RESULT* return_value) > Body;

  CachedFunction(Engine* engine, const signature::FunctionSignature& signature)
    : engine_(engine), signature_(signature) {}

  /** Registers the signature to the engine. Must be done once before any call. */
  ErrorStack  register_function() { return engine_->register_function(signature_); }

  /** Returns the stored result of an equivalent call, or runs body and stores its result. */
  ErrorStack  call(
    const signature::Arguments& arguments,
    const Body& body,
    CachedResult<RESULT>* result) {
    RESULT computed = RESULT();
    ReturnValueHandler handler = make_handler(&result->return_value_);
    Computation computation = [&body, &computed](
      const entry::OutputDirPaths& output_dirs,
      std::string* return_blob) -> ErrorStack {
      CHECK_ERROR(body(output_dirs, &computed));
      WRAP_ERROR_CODE(codec::ValueCodec<RESULT>::encode(computed, return_blob));
      return kRetOk;
    };
    CallResult call_result;
    CHECK_ERROR(engine_->get_or_compute(signature_, arguments, handler, computation, &call_result));
    if (!call_result.hit_) {
      result->return_value_ = computed;
    }
    copy_result(call_result, result);
    return kRetOk;
  }

  /** Returns the stored result without computing. kErrorCodeEntryNotFound if there is none. */
  ErrorStack  lookup(const signature::Arguments& arguments, CachedResult<RESULT>* result) {
    ReturnValueHandler handler = make_handler(&result->return_value_);
    CallResult call_result;
    CHECK_ERROR(engine_->lookup(signature_, arguments, handler, &call_result));
    copy_result(call_result, result);
    return kRetOk;
  }

  /** Removes the stored result of the call, if any. */
  ErrorStack  invalidate(const signature::Arguments& arguments) {
    return engine_->invalidate(signature_, arguments);
  }

  const signature::FunctionSignature& get_signature() const { return signature_; }
  Engine*                             get_engine() const { return engine_; }

 private:
  /** On a hit, the engine decodes straight into out. */
  static ReturnValueHandler make_handler(RESULT* out) {
    ReturnValueHandler handler;
    handler.has_return_value_ = codec::ValueCodec<RESULT>::has_value();
    handler.load_ = [out](const std::string& return_blob) -> ErrorCode {
      return codec::ValueCodec<RESULT>::decode(return_blob, out);
    };
    return handler;
  }

  static void copy_result(const CallResult& from, CachedResult<RESULT>* to) {
    to->output_dirs_ = from.output_dirs_;
    to->hit_ = from.hit_;
    to->key_ = from.key_;
    to->entry_path_ = from.entry_path_;
  }

  Engine* const                       engine_;
  const signature::FunctionSignature  signature_;
};

}  // namespace memento
#endif  // MEMENTO_CACHED_FUNCTION_HPP_
