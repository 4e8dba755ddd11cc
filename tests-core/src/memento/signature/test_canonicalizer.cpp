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

#include <string>
#include <vector>

#include "memento/error_code.hpp"
#include "memento/error_stack.hpp"
#include "memento/test_common.hpp"
#include "memento/signature/arguments.hpp"
#include "memento/signature/canonical_string.hpp"
#include "memento/signature/canonicalizer.hpp"
#include "memento/signature/function_signature.hpp"

namespace memento {
namespace signature {
DEFINE_TEST_CASE_PACKAGE(CanonicalizerTest, memento.signature);

std::string canonicalize(const FunctionSignature& sig, const Arguments& args) {
  std::string out;
  COERCE_ERROR(Canonicalizer::canonicalize(sig, args, &out));
  return out;
}

ErrorCode canonicalize_error(const FunctionSignature& sig, const Arguments& args) {
  std::string out;
  return Canonicalizer::canonicalize(sig, args, &out).get_error_code();
}

TEST(CanonicalizerTest, CanonicalStrings) {
  EXPECT_EQ("3", to_canonical_string(3));
  EXPECT_EQ("-12", to_canonical_string(static_cast<int64_t>(-12)));
  EXPECT_EQ("true", to_canonical_string(true));
  EXPECT_EQ("0.5", to_canonical_string(0.5));
  EXPECT_EQ("abc", to_canonical_string(std::string("abc")));
  EXPECT_EQ("abc", to_canonical_string("abc"));
  std::vector<std::string> list;
  list.push_back("a,b");
  list.push_back("c");
  EXPECT_EQ("[2:a\\,b,c]", to_canonical_string(list));
  EXPECT_EQ("[0:]", to_canonical_string(std::vector<int>()));
}

TEST(CanonicalizerTest, VectorsDoNotCollide) {
  std::vector<std::string> empty;
  std::vector<std::string> one_empty(1, "");
  EXPECT_EQ("[1:]", to_canonical_string(one_empty));
  EXPECT_NE(to_canonical_string(empty), to_canonical_string(one_empty));
  EXPECT_NE(to_canonical_string(one_empty), to_canonical_string(std::vector<std::string>(2, "")));

  std::vector<std::string> joined(1, "a,b");
  std::vector<std::string> split;
  split.push_back("a");
  split.push_back("b");
  EXPECT_NE(to_canonical_string(joined), to_canonical_string(split));

  std::vector< std::vector<int> > nested_empty;
  std::vector< std::vector<int> > nested_one(1, std::vector<int>());
  EXPECT_NE(to_canonical_string(nested_empty), to_canonical_string(nested_one));

  FunctionSignature sig("f");
  sig.add_input("names");
  EXPECT_NE(canonicalize(sig, Arguments().set("names", empty)),
            canonicalize(sig, Arguments().set("names", one_empty)));
}

TEST(CanonicalizerTest, DeclarationOrder) {
  FunctionSignature sig("sum");
  sig.add_input("x").add_input("y");
  // the order of set() doesn't matter
  EXPECT_EQ("x=1;y=2", canonicalize(sig, Arguments().set("y", 2).set("x", 1)));
  EXPECT_EQ("x=1;y=2", canonicalize(sig, Arguments().set("x", 1).set("y", 2)));
}

TEST(CanonicalizerTest, DefaultIsBound) {
  FunctionSignature sig("sum");
  sig.add_input("x").add_input("y", 10);
  EXPECT_EQ("x=1;y=10", canonicalize(sig, Arguments().set("x", 1)));
  // giving the default explicitly is the same call
  EXPECT_EQ("x=1;y=10", canonicalize(sig, Arguments().set("x", 1).set("y", 10)));
}

TEST(CanonicalizerTest, Exclude) {
  FunctionSignature sig("sum");
  sig.add_input("x").add_input("y").add_input("verbose", false).exclude("verbose");
  std::string a = canonicalize(sig, Arguments().set("x", 1).set("y", 2).set("verbose", true));
  std::string b = canonicalize(sig, Arguments().set("x", 1).set("y", 2).set("verbose", false));
  EXPECT_EQ("x=1;y=2", a);
  EXPECT_EQ(a, b);
}

TEST(CanonicalizerTest, ExcludeIfDefault) {
  FunctionSignature sig("sum");
  sig.add_input("x").add_input("y").add_input("z", 0).exclude_if_default("z");
  EXPECT_EQ("x=1;y=2", canonicalize(sig, Arguments().set("x", 1).set("y", 2)));
  EXPECT_EQ("x=1;y=2", canonicalize(sig, Arguments().set("x", 1).set("y", 2).set("z", 0)));
  EXPECT_EQ("x=1;y=2;z=3", canonicalize(sig, Arguments().set("x", 1).set("y", 2).set("z", 3)));
}

TEST(CanonicalizerTest, AllExcluded) {
  FunctionSignature sig("constant");
  sig.add_input("verbose", false).exclude("verbose");
  EXPECT_EQ("", canonicalize(sig, Arguments()));
  FunctionSignature empty("nullary");
  EXPECT_EQ("", canonicalize(empty, Arguments()));
}

TEST(CanonicalizerTest, OutputDirectoryNotRendered) {
  FunctionSignature sig("train");
  sig.add_input("adata_path").add_output_directory("output_model_dir");
  EXPECT_EQ("adata_path=/data/a", canonicalize(sig, Arguments().set("adata_path", "/data/a")));
}

TEST(CanonicalizerTest, Escape) {
  EXPECT_EQ("a\\=b\\;c\\\\d", Canonicalizer::escape("a=b;c\\d"));
  FunctionSignature sig("f");
  sig.add_input("a").add_input("b");
  // without escaping both would render as "a=1;b=2;b=3"
  std::string one = canonicalize(sig, Arguments().set("a", "1;b=2").set("b", "3"));
  std::string two = canonicalize(sig, Arguments().set("a", "1").set("b", "2;b=3"));
  EXPECT_NE(one, two);
  EXPECT_EQ("a=1\\;b\\=2;b=3", one);
}

TEST(CanonicalizerTest, BindErrors) {
  FunctionSignature sig("train");
  sig.add_input("x").add_input("y", 1).add_output_directory("out");
  EXPECT_EQ(kErrorCodeSigMissingArgument, canonicalize_error(sig, Arguments().set("y", 2)));
  EXPECT_EQ(kErrorCodeSigUnknownArgument,
    canonicalize_error(sig, Arguments().set("x", 1).set("w", 2)));
  EXPECT_EQ(kErrorCodeSigOutputDirSupplied,
    canonicalize_error(sig, Arguments().set("x", 1).set("out", "/tmp/somewhere")));
  EXPECT_EQ(kErrorCodeOk, canonicalize_error(sig, Arguments().set("x", 1)));
}

TEST(CanonicalizerTest, BoundArguments) {
  FunctionSignature sig("f");
  sig.add_input("b").add_input("a", "dflt");
  Canonicalizer::BoundArguments bound;
  COERCE_ERROR(Canonicalizer::bind(sig, Arguments().set("b", 2), &bound));
  ASSERT_EQ(2U, bound.size());
  EXPECT_EQ("b", bound[0].first);
  EXPECT_EQ("2", bound[0].second);
  EXPECT_EQ("a", bound[1].first);
  EXPECT_EQ("dflt", bound[1].second);
}

TEST(CanonicalizerTest, ValidateSignature) {
  EXPECT_FALSE(FunctionSignature("sum").add_input("x").validate().is_error());
  EXPECT_EQ(kErrorCodeConfInvalidFunctionName,
    FunctionSignature("").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfInvalidFunctionName,
    FunctionSignature("a/b").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfInvalidFunctionName,
    FunctionSignature(".hidden").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfInvalidParameterName,
    FunctionSignature("f").add_input("").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfInvalidParameterName,
    FunctionSignature("f").add_output_directory("success_token").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfInvalidParameterName,
    FunctionSignature("f").add_output_directory("../escape").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfDuplicateParameter,
    FunctionSignature("f").add_input("x").add_input("x", 1).validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfDuplicateParameter,
    FunctionSignature("f").add_input("x").add_output_directory("x").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfUnknownExcludeName,
    FunctionSignature("f").add_input("x").exclude("y").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfUnknownExcludeName,
    FunctionSignature("f").add_input("x").exclude_if_default("y").validate().get_error_code());
  EXPECT_EQ(kErrorCodeConfNoDefaultValue,
    FunctionSignature("f").add_input("x").exclude_if_default("x").validate().get_error_code());
}

TEST(CanonicalizerTest, FunctionNames) {
  EXPECT_TRUE(FunctionSignature::is_valid_function_name("my_cached_sum"));
  EXPECT_TRUE(FunctionSignature::is_valid_function_name("train-v2.1"));
  EXPECT_FALSE(FunctionSignature::is_valid_function_name(""));
  EXPECT_FALSE(FunctionSignature::is_valid_function_name(".."));
  EXPECT_FALSE(FunctionSignature::is_valid_function_name("with space"));
  EXPECT_FALSE(FunctionSignature::is_valid_function_name("line\nbreak"));
}

}  // namespace signature
}  // namespace memento

TEST_MAIN_CAPTURE_SIGNALS(CanonicalizerTest, memento.signature);
