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
#include "memento/test_common.hpp"

#include <signal.h>
#include <stdint.h>
#include <tinyxml2.h>
#include <unistd.h>

#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "memento/engine_options.hpp"
#include "memento/assorted/assorted_func.hpp"
#include "memento/assorted/rich_backtrace.hpp"
#include "memento/fs/filesystem.hpp"
#include "memento/fs/path.hpp"

namespace memento {
  std::string get_random_name() {
    // to further randomize the name, we use hash of executable's path and its parameter.
    // we run many concurrent testcases, but all of them have different executable or parameters.

    std::string seed;
    std::ifstream in;
    in.open("/proc/self/cmdline", std::ios_base::in);
    if (!in.is_open()) {
      // there are cases where /proc/self/cmdline doesn't work. in that case just executable path
      seed = assorted::get_current_executable_path();
    } else {
      std::getline(in, seed);
      in.close();
    }

    std::hash<std::string> h1;
    uint64_t differentiator = h1(seed);
    return fs::unique_name("%%%%_%%%%_%%%%_%%%%", differentiator);
  }

  std::string get_random_tmp_file_path(const std::string& name) {
    return std::string("tmp_files/") + get_random_name() + "/" + name;
  }

  EngineOptions get_randomized_paths() {
    EngineOptions options;
    std::string uniquefier = get_random_name();
    std::cout << "test uniquefier=" << uniquefier << std::endl;
    options.storage_.cache_root_ = std::string("tmp_caches/") + uniquefier;
    return options;
  }

  EngineOptions get_tiny_options() {
    EngineOptions options = get_randomized_paths();
    options.debugging_.debug_log_min_threshold_ = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.debug_log_stderr_threshold_
      = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.verbose_log_level_ = 1;
    options.debugging_.verbose_modules_ = "*";
    options.storage_.durable_commit_ = false;  // fsync only slows down tests
    return options;
  }

  void remove_files_start_with(const fs::Path &folder, const fs::Path &prefix) {
    if (fs::exists(folder)) {
      std::vector< fs::Path > child_paths(folder.child_paths());
      for (fs::Path child : child_paths) {
        if (child.string().find(prefix.string()) == 0) {
          fs::remove_all(child);
        }
      }
    }
  }
  void cleanup_test(const EngineOptions& options) {
    if (!options.storage_.cache_root_.empty()) {
      fs::remove_all(fs::Path(options.storage_.cache_root_));
    }
  }

  // Only the signals we capture below. Others never reach the handler.
  std::string to_signal_name(int sig) {
    switch (sig) {
    case SIGABRT   : return "Abort (ANSI).";
    case SIGBUS    : return "BUS error (4.2 BSD).";
    case SIGFPE    : return "Floating-point exception (ANSI).";
    case SIGSEGV   : return "Segmentation violation (ANSI).";
    default:
      return "UNKNOWN";
    }
  }

  struct GtestContext {
    std::string xml_path_;
    std::string individual_test_;
    std::string test_case_name_;
    std::string package_name_;
  };
  GtestContext gtest_context;

  /** A JUnit-format result that reports one failed testcase. */
  std::string generate_failure_xml(const std::string& type, const std::string& details) {
    const std::string class_name
      = gtest_context.package_name_ + "." + gtest_context.test_case_name_;
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLElement* root = doc.NewElement("testsuites");
    root->SetAttribute("name", "AllTests");
    root->SetAttribute("tests", 1);
    root->SetAttribute("failures", 1);
    root->SetAttribute("errors", 0);
    root->SetAttribute("time", 0);
    doc.InsertFirstChild(root);

    tinyxml2::XMLElement* suite = doc.NewElement("testsuite");
    suite->SetAttribute("name", class_name.c_str());
    suite->SetAttribute("tests", 1);
    suite->SetAttribute("failures", 1);
    suite->SetAttribute("errors", 0);
    suite->SetAttribute("disabled", 0);
    suite->SetAttribute("time", 0);
    root->InsertFirstChild(suite);

    tinyxml2::XMLElement* testcase = doc.NewElement("testcase");
    testcase->SetAttribute("name", gtest_context.individual_test_.c_str());
    testcase->SetAttribute("status", "run");
    testcase->SetAttribute("classname", class_name.c_str());
    testcase->SetAttribute("time", 0);
    suite->InsertFirstChild(testcase);

    tinyxml2::XMLElement* failure = doc.NewElement("failure");
    failure->SetAttribute("type", type.c_str());
    failure->SetAttribute("message", details.c_str());
    testcase->InsertFirstChild(failure);

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr();
  }

  bool write_result_xml(const std::string& xml) {
    std::ofstream out;
    out.open(gtest_context.xml_path_, std::ios_base::out | std::ios_base::trunc);
    if (!out.is_open()) {
      return false;
    }
    out << xml;
    out.flush();
    out.close();
    return true;
  }

  static void handle_signals(int sig, siginfo_t* si, void* /*unused*/) {
    std::stringstream str;
    str << "====   SIGNAL " << sig << "(" << to_signal_name(sig) << ") while running "
      << gtest_context.package_name_ << "." << gtest_context.test_case_name_
      << " at address=" << si->si_addr << std::endl;
    std::vector<std::string> traces = assorted::get_backtrace(true);
    for (uint16_t i = 0; i < traces.size(); ++i) {
      str << "- [" << i << "/" << traces.size() << "] " << traces[i] << std::endl;
    }

    std::string details = str.str();
    std::cerr << details;
    if (gtest_context.xml_path_.empty()) {
      std::cerr << "XML Output file was not specified, so we exit as a usual crash" << std::endl;
      ::exit(1);
    }

    std::cerr << "Converting the signal to a testcase failure in " << gtest_context.xml_path_
      << std::endl;
    if (!write_result_xml(generate_failure_xml(to_signal_name(sig), details))) {
      std::cerr << "Couldn't open xml file. os_error= " << assorted::os_error() << std::endl;
    }
    ::exit(1);
  }

  void register_signal_handlers(
    const char* test_case_name,
    const char* package_name,
    int argc,
    char** argv) {
    const std::string kXmlPrefix("--gtest_output=xml:");
    const std::string kFilterPrefix("--gtest_filter=*.");
    gtest_context.test_case_name_ = test_case_name;
    gtest_context.package_name_ = package_name;
    gtest_context.xml_path_.clear();
    gtest_context.individual_test_.clear();
    for (int i = 1; i < argc; ++i) {
      std::string str(argv[i]);
      if (str.find(kXmlPrefix) == 0) {
        gtest_context.xml_path_ = str.substr(kXmlPrefix.size());
      } else if (str.find(kFilterPrefix) == 0) {
        gtest_context.individual_test_ = str.substr(kFilterPrefix.size());
      }
    }
    std::cout << "*****  memento testcase " << package_name << "." << test_case_name
      << " xml=" << (gtest_context.xml_path_.empty() ? "(none)" : gtest_context.xml_path_)
      << " filter=" << (gtest_context.individual_test_.empty() ? "(all)"
                        : gtest_context.individual_test_)
      << std::endl;

    struct sigaction sa;
    sa.sa_flags = SA_SIGINFO;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_sigaction = handle_signals;

    // SIGKILL/SIGSTOP cannot be captured. pre_populate_error_result_xml() covers them.
    ::sigaction(SIGABRT, &sa, nullptr);
    ::sigaction(SIGBUS, &sa, nullptr);
    ::sigaction(SIGFPE, &sa, nullptr);
    ::sigaction(SIGSEGV, &sa, nullptr);
  }

  void pre_populate_error_result_xml() {
    if (gtest_context.xml_path_.empty()) {
      return;
    }
    // if the result stays like this, the process disappeared without trace.
    // gtest overwrites it when the run completes.
    std::string xml = generate_failure_xml(
      std::string("Pre-populated Error. Test timeout happened?"),
      std::string("This is an initially written gtest xml before test execution."
        " The process was probably killed via SIGSTOP or SIGKILL."));
    if (!write_result_xml(xml)) {
      std::cerr << "Couldn't pre-populate " << gtest_context.xml_path_ << std::endl;
    }
  }
}  // namespace memento
