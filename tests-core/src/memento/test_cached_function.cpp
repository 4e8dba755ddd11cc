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

#include "memento/cached_function.hpp"
#include "memento/engine.hpp"
#include "memento/engine_options.hpp"
#include "memento/error_code.hpp"
#include "memento/error_stack.hpp"
#include "memento/initializable.hpp"
#include "memento/test_common.hpp"
#include "memento/codec/value_codec.hpp"
#include "memento/fs/entry_file.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/fs/path.hpp"
#include "memento/signature/arguments.hpp"
#include "memento/signature/function_signature.hpp"

namespace memento {
DEFINE_TEST_CASE_PACKAGE(CachedFunctionTest, memento);

TEST(CachedFunctionTest, TrainWritesModel) {
  EngineOptions options = get_tiny_options();
  Engine engine(options);
  COERCE_ERROR(engine.initialize());
  {
    UninitializeGuard guard(&engine);
    signature::FunctionSignature sig("train");
    sig.add_input("adata_path").add_input("n_hidden", 128).add_output_directory("output_model_dir");
    CachedFunction<int32_t> train(&engine, sig);
    COERCE_ERROR(train.register_function());

    const std::string adata_path("path/to/adata");
    int executions = 0;
    CachedFunction<int32_t>::Body body = [&](
      const entry::OutputDirPaths& dirs,
      int32_t* out) -> ErrorStack {
      ++executions;
      fs::Path model = dirs.at("output_model_dir") / "model.bin";
      WRAP_ERROR_CODE(fs::write_whole_file(model, "weights of " + adata_path, false));
      *out = 42;
      return kRetOk;
    };
    signature::Arguments args;
    args.set("adata_path", adata_path);

    CachedResult<int32_t> first;
    COERCE_ERROR(train.call(args, body, &first));
    CachedResult<int32_t> second;
    COERCE_ERROR(train.call(args, body, &second));

    EXPECT_EQ(1, executions);
    EXPECT_FALSE(first.hit_);
    EXPECT_TRUE(second.hit_);
    EXPECT_EQ(42, first.return_value_);
    EXPECT_EQ(42, second.return_value_);
    ASSERT_EQ(1U, second.output_dirs_.size());
    EXPECT_EQ(first.output_dirs_.at("output_model_dir"),
              second.output_dirs_.at("output_model_dir"));
    EXPECT_EQ(second.entry_path_ / "output_model_dir", second.output_dirs_.at("output_model_dir"));

    std::string model;
    EXPECT_EQ(kErrorCodeOk, fs::read_whole_file(
      second.output_dirs_.at("output_model_dir") / "model.bin",
      &model));
    EXPECT_EQ("weights of path/to/adata", model);

    // n_hidden given explicitly with its default value is still the same entry
    signature::Arguments explicit_default;
    explicit_default.set("adata_path", adata_path).set("n_hidden", 128);
    CachedResult<int32_t> third;
    COERCE_ERROR(train.call(explicit_default, body, &third));
    EXPECT_TRUE(third.hit_);
    EXPECT_EQ(1, executions);
    COERCE_ERROR(engine.uninitialize());
  }
  cleanup_test(options);
}

TEST(CachedFunctionTest, NoReturnValue) {
  EngineOptions options = get_tiny_options();
  Engine engine(options);
  COERCE_ERROR(engine.initialize());
  {
    UninitializeGuard guard(&engine);
    signature::FunctionSignature sig("my_cached_sum");
    sig.add_input("a").add_input("b").add_output_directory("output_dir");
    CachedFunction<codec::NoReturnValue> cached_sum(&engine, sig);
    COERCE_ERROR(cached_sum.register_function());

    int executions = 0;
    CachedFunction<codec::NoReturnValue>::Body body = [&executions](
      const entry::OutputDirPaths& dirs,
      codec::NoReturnValue*) -> ErrorStack {
      ++executions;
      WRAP_ERROR_CODE(fs::write_whole_file(dirs.at("output_dir") / "result.txt", "3", false));
      return kRetOk;
    };
    signature::Arguments args;
    args.set("a", 1).set("b", 2);
    CachedResult<codec::NoReturnValue> first;
    COERCE_ERROR(cached_sum.call(args, body, &first));
    CachedResult<codec::NoReturnValue> second;
    COERCE_ERROR(cached_sum.call(args, body, &second));
    EXPECT_EQ(1, executions);
    EXPECT_TRUE(second.hit_);
    EXPECT_FALSE(fs::exists(second.entry_path_ / "return_value.bin"));

    std::string content;
    EXPECT_EQ(kErrorCodeOk,
      fs::read_whole_file(second.output_dirs_.at("output_dir") / "result.txt", &content));
    EXPECT_EQ("3", content);
    COERCE_ERROR(engine.uninitialize());
  }
  cleanup_test(options);
}

TEST(CachedFunctionTest, ContainerResult) {
  EngineOptions options = get_tiny_options();
  Engine engine(options);
  COERCE_ERROR(engine.initialize());
  {
    UninitializeGuard guard(&engine);
    typedef std::map<std::string, std::vector<double> > Scores;
    signature::FunctionSignature sig("score");
    sig.add_input("genes").add_input("seed", 0);
    CachedFunction<Scores> score(&engine, sig);
    COERCE_ERROR(score.register_function());

    std::vector<std::string> genes;
    genes.push_back("CD4");
    genes.push_back("CD8A");
    CachedFunction<Scores>::Body body = [&genes](
      const entry::OutputDirPaths&,
      Scores* out) -> ErrorStack {
      for (size_t i = 0; i < genes.size(); ++i) {
        (*out)[genes[i]].push_back(0.1 * static_cast<double>(i + 1));
      }
      return kRetOk;
    };
    signature::Arguments args;
    args.set("genes", genes);
    CachedResult<Scores> first;
    COERCE_ERROR(score.call(args, body, &first));
    CachedResult<Scores> second;
    COERCE_ERROR(score.call(args, body, &second));
    EXPECT_TRUE(second.hit_);
    EXPECT_EQ(first.return_value_, second.return_value_);
    ASSERT_EQ(1U, second.return_value_["CD8A"].size());
    EXPECT_DOUBLE_EQ(0.2, second.return_value_["CD8A"][0]);
    COERCE_ERROR(engine.uninitialize());
  }
  cleanup_test(options);
}

TEST(CachedFunctionTest, BodyError) {
  EngineOptions options = get_tiny_options();
  Engine engine(options);
  COERCE_ERROR(engine.initialize());
  {
    UninitializeGuard guard(&engine);
    signature::FunctionSignature sig("fails_once");
    sig.add_input("x");
    CachedFunction<int32_t> fails_once(&engine, sig);
    COERCE_ERROR(fails_once.register_function());

    int executions = 0;
    CachedFunction<int32_t>::Body body = [&executions](
      const entry::OutputDirPaths&,
      int32_t* out) -> ErrorStack {
      ++executions;
      if (executions == 1) {
        return ERROR_STACK_MSG(kErrorCodeComputationFailed, "transient");
      }
      *out = 7;
      return kRetOk;
    };
    signature::Arguments args;
    args.set("x", 1);
    CachedResult<int32_t> result;
    EXPECT_EQ(kErrorCodeComputationFailed,
      fails_once.call(args, body, &result).get_error_code());
    // nothing was cached, so the next call retries
    COERCE_ERROR(fails_once.call(args, body, &result));
    EXPECT_FALSE(result.hit_);
    EXPECT_EQ(7, result.return_value_);
    EXPECT_EQ(2, executions);
    COERCE_ERROR(engine.uninitialize());
  }
  cleanup_test(options);
}

}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(CachedFunctionTest, memento);
