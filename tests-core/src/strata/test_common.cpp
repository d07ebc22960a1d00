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
#include "strata/test_common.hpp"

#include <signal.h>
#include <stdlib.h>
#include <time.h>
#include <tinyxml2.h>
#include <unistd.h>

#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "strata/cxx11.hpp"
#include "strata/assorted/assorted_func.hpp"
#include "strata/assorted/rich_backtrace.hpp"
#include "strata/debugging/debugging_options.hpp"

namespace strata {
  std::string get_random_name() {
    // to further randomize the name, we use hash of executable's arguments.
    // we run many concurrent testcases, but all of them have different executable or parameters.
    std::string seed;
    std::ifstream in;
    in.open("/proc/self/cmdline", std::ios_base::in);
    if (in.is_open()) {
      std::getline(in, seed);
      in.close();
    }

    std::hash<std::string> h1;
    uint64_t differentiator = h1(seed);
    differentiator ^= static_cast<uint64_t>(::getpid()) << 32;
    differentiator ^= static_cast<uint64_t>(::time(CXX11_NULLPTR));
    ::srand(static_cast<unsigned int>(differentiator));

    const char* kHex = "0123456789abcdef";
    std::string name("%%%%_%%%%_%%%%_%%%%");
    for (size_t i = 0; i < name.size(); ++i) {
      if (name[i] == '%') {
        name[i] = kHex[(::rand() ^ differentiator) & 0xF];
        differentiator >>= 1;
      }
    }
    return name;
  }

  std::string get_random_tmp_file_path(const std::string& name) {
    return std::string("tmp_") + get_random_name() + "_" + name;
  }

  StrataOptions get_tiny_options() {
    StrataOptions options;
    options.debugging_.debug_log_to_stderr_ = true;
    options.debugging_.debug_log_min_threshold_ = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.debug_log_stderr_threshold_
      = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.verbose_log_level_ = 1;
    options.debugging_.verbose_modules_ = "*";

    options.reclaim_.participant_slots_ = 16;
    options.reclaim_.auto_collect_threshold_ = 64;
    options.pagecache_.page_table_capacity_ = 1 << 10;
    options.pagecache_.segment_size_ = 1 << 12;
    return options;
  }

  std::string to_signal_name(int sig) {
    switch (sig) {
    case SIGHUP    : return "Hangup (POSIX).";
    case SIGINT    : return "Interrupt (ANSI).";
    case SIGQUIT   : return "Quit (POSIX).";
    case SIGILL    : return "Illegal instruction (ANSI).";
    case SIGTRAP   : return "Trace trap (POSIX).";
    case SIGABRT   : return "Abort (ANSI).";
    case SIGBUS    : return "BUS error (4.2 BSD).";
    case SIGFPE    : return "Floating-point exception (ANSI).";
    case SIGKILL   : return "Kill, unblockable (POSIX).";
    case SIGUSR1   : return "User-defined signal 1 (POSIX).";
    case SIGSEGV   : return "Segmentation violation (ANSI).";
    case SIGUSR2   : return "User-defined signal 2 (POSIX).";
    case SIGPIPE   : return "Broken pipe (POSIX).";
    case SIGALRM   : return "Alarm clock (POSIX).";
    case SIGTERM   : return "Termination (ANSI).";
    case SIGSTKFLT : return "Stack fault.";
    case SIGCHLD   : return "Child status has changed (POSIX).";
    case SIGCONT   : return "Continue (POSIX).";
    case SIGSTOP   : return "Stop, unblockable (POSIX).";
    case SIGTSTP   : return "Keyboard stop (POSIX).";
    case SIGTTIN   : return "Background read from tty (POSIX).";
    case SIGTTOU   : return "Background write to tty (POSIX).";
    case SIGURG    : return "Urgent condition on socket (4.2 BSD).";
    case SIGXCPU   : return "CPU limit exceeded (4.2 BSD).";
    case SIGXFSZ   : return "File size limit exceeded (4.2 BSD).";
    case SIGVTALRM : return "Virtual alarm clock (4.2 BSD).";
    case SIGPROF   : return "Profiling alarm clock (4.2 BSD).";
    case SIGWINCH  : return "Window size change (4.3 BSD, Sun).";
    case SIGIO   : return "I/O now possible (4.2 BSD).";
    case SIGPWR    : return "Power failure restart (System V).";
    case SIGSYS    : return "Bad system call.";
    default:
      return "UNKNOWN";
    }
  }
  std::string gtest_xml_path;
  std::string gtest_individual_test;
  std::string gtest_test_case_name;
  std::string gtest_package_name;
  std::string generate_failure_xml(const std::string& type, const std::string& details) {
    // The XML must be in JUnit format
    // https://svn.jenkins-ci.org/trunk/hudson/dtkit/dtkit-format/dtkit-junit-model/src/main/resources/com/thalesgroup/dtkit/junit/model/xsd/junit-4.xsd
    // http://windyroad.com.au/dl/Open%20Source/JUnit.xsd
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLElement* root = doc.NewElement("testsuites");
    root->SetAttribute("name", "AllTests");
    root->SetAttribute("tests", 1);
    root->SetAttribute("failures", 1);
    root->SetAttribute("errors", 0);
    root->SetAttribute("time", 0);
    doc.InsertFirstChild(root);

    tinyxml2::XMLElement* suite = doc.NewElement("testsuite");
    suite->SetAttribute("name", (gtest_package_name + "." + gtest_test_case_name).c_str());
    suite->SetAttribute("tests", 1);
    suite->SetAttribute("failures", 1);
    suite->SetAttribute("errors", 0);
    suite->SetAttribute("disabled", 0);
    suite->SetAttribute("time", 0);
    root->InsertFirstChild(suite);

    tinyxml2::XMLElement* testcase = doc.NewElement("testcase");
    testcase->SetAttribute("name", gtest_individual_test.c_str());
    testcase->SetAttribute("status", "run");
    testcase->SetAttribute("classname", (gtest_package_name + "." + gtest_test_case_name).c_str());
    testcase->SetAttribute("time", 0);
    suite->InsertFirstChild(testcase);

    tinyxml2::XMLElement* test = doc.NewElement("failure");
    test->SetAttribute("type", type.c_str());
    test->SetAttribute("message", details.c_str());
    testcase->InsertFirstChild(test);

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr();
  }
  std::string generate_failure_xml(int sig, const std::string& details) {
    return generate_failure_xml(to_signal_name(sig), details);
  }
  static void handle_signals(int sig, siginfo_t* si, void* /*unused*/) {
    std::stringstream str;
    str << "================================================================" << std::endl;
    str << "====   SIGNAL Received While Running Testcase" << std::endl;
    str << "====   SIGNAL Code=" << sig << "("<< to_signal_name(sig) << ")" << std::endl;
    str << "====   At address=" << si->si_addr << std::endl;
    str << "================================================================" << std::endl;

    std::vector<std::string> traces = assorted::get_backtrace(true);

    str << "=== Stack frame (length=" << traces.size() << ")" << std::endl;
    for (uint16_t i = 0; i < traces.size(); ++i) {
      str << "- [" << i << "/" << traces.size() << "] " << traces[i] << std::endl;
    }

    std::string details = str.str();
    std::cerr << details;

    if (gtest_xml_path.size() == 0) {
      std::cerr << "XML Output file was not specified, so we exit as a usual crash" << std::endl;
      ::exit(1);
    } else {
      std::cerr << "Converting the signal to a testcase failure in " << gtest_xml_path << std::endl;
      // We report this error in the result XML.
      std::string xml = generate_failure_xml(sig, details);
      std::cerr << "Xml content: " << std::endl << xml << std::endl;

      std::ofstream out;
      out.open(gtest_xml_path, std::ios_base::out | std::ios_base::trunc);
      if (!out.is_open()) {
        std::cerr << "Couldn't open xml file. os_error= " << assorted::os_error() << std::endl;
        ::exit(1);
      }
      out << xml;
      out.flush();
      out.close();
      std::cerr << "Wrote out result xml file. Now exitting.." << std::endl;
      ::exit(1);
    }
  }
  void register_signal_handlers(
    const char* test_case_name,
    const char* package_name,
    int argc,
    char** argv) {

    std::cout << "****************************************************************" << std::endl;
    std::cout << "*****  Started STRATA Unit Testcase " << std::endl;
    std::cout << "*****  Testcase name: " << test_case_name << std::endl;
    std::cout << "*****  Test Package name: " << package_name << std::endl;
    std::cout << "*****  Arguments (argc=" << argc << "): " << std::endl;

    gtest_test_case_name = test_case_name;
    gtest_package_name = package_name;
    gtest_xml_path = "";
    gtest_individual_test = "";
    for (int i = 0; i < argc; ++i) {
      std::cout << "*****    argv[" << i << "]: " << argv[i] << std::endl;
      std::string str(argv[i]);
      if (str.find("--gtest_output=xml:") == 0) {
        gtest_xml_path = str.substr(std::string("--gtest_output=xml:").size());
      } else if (str.find("--gtest_filter=*.") == 0) {
        gtest_individual_test = str.substr(std::string("--gtest_filter=*.").size());
      }
    }
    if (gtest_xml_path.size() > 0) {
      std::cout << "*****  XML Output: " << gtest_xml_path << std::endl;
    } else {
      std::cout << "*****  XML Output file was not specified. Executed manually?" << std::endl;
    }
    if (gtest_individual_test.size() > 0) {
      std::cout << "*****  Running an individual test: " << gtest_individual_test << std::endl;
    } else {
      std::cout << "*****  Individual test was not specified. Executed manually?" << std::endl;
    }
    std::cout << "****************************************************************" << std::endl;

    struct sigaction sa;
    sa.sa_flags = SA_SIGINFO;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_sigaction = handle_signals;

    // we do not capture all signals. Only the followings are considered as 'expected'
    // testcase failures.
    ::sigaction(SIGABRT, &sa, CXX11_NULLPTR);
    ::sigaction(SIGBUS, &sa, CXX11_NULLPTR);
    ::sigaction(SIGFPE, &sa, CXX11_NULLPTR);
    ::sigaction(SIGSEGV, &sa, CXX11_NULLPTR);
    // SIGKILL/SIGSTOP cannot be captured, so a timeout-kill by ctest is covered only by
    // pre_populate_error_result_xml().
  }

  void pre_populate_error_result_xml() {
    if (gtest_xml_path.size() > 0) {
      std::string xml = generate_failure_xml(
        std::string("Pre-populated Error. Test timeout happned?"),
        std::string("This is an initially written gtest xml before test execution."
        " If you are receiving this result, most likely the process has disappeared without trace."
        " This can happen when ctest kills the process via SIGSTOP, or someone killed the process"
        " via SIGKILL, etc."));

      std::ofstream out;
      out.open(gtest_xml_path, std::ios_base::out | std::ios_base::trunc);
      if (out.is_open()) {
        out << xml;
        out.flush();
        out.close();
      }
    }
  }
}  // namespace strata
