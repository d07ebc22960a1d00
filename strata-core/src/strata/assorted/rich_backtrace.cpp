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
#include "strata/assorted/rich_backtrace.hpp"

#include <backtrace.h>
#include <execinfo.h>
#include <stdint.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "strata/assorted/assorted_func.hpp"

namespace strata {
namespace assorted {

/** Frames collected from both glibc and libbacktrace for one get_backtrace() call. */
struct BacktraceFrames {
  enum Constants {
    kMaxDepth = 64,
  };
  struct GlibcFrame {
    void*         address_;
    std::string   symbol_;
    std::string   binary_path_;
    std::string   function_;
  };
  struct SourceFrame {
    uintptr_t     address_;
    std::string   srcfile_;
    int           srclineno_;
    std::string   function_;
  };

  void collect_glibc();
  std::vector<std::string> format(uint16_t skip) const;

  std::string               error_;
  std::vector<GlibcFrame>   glibc_;
  std::vector<SourceFrame>  source_;
};

namespace {
/** "/path/binary(mangled+0x12) [0x4005]" -> binary path and mangled function name. */
void parse_glibc_symbol(BacktraceFrames::GlibcFrame* frame) {
  const std::string& symbol = frame->symbol_;
  std::size_t open = symbol.find('(');
  std::size_t close = symbol.find(')');
  if (open == std::string::npos || close == std::string::npos || open >= close) {
    return;
  }
  frame->binary_path_ = symbol.substr(0, open);
  std::size_t plus = symbol.find('+', open);
  if (plus != std::string::npos && plus < close && plus > open + 1) {
    frame->function_ = symbol.substr(open + 1, plus - open - 1);
  }
}

void on_create_state_error(void* data, const char* msg, int errnum) {
  std::stringstream str;
  str << "libbacktrace could not create state. msg=" << msg << ", err=" << os_error(errnum);
  reinterpret_cast<BacktraceFrames*>(data)->error_ = str.str();
}

void on_full_error(void* data, const char* msg, int errnum) {
  std::stringstream str;
  str << "libbacktrace could not walk the stack. msg=" << msg << ", err=" << os_error(errnum);
  reinterpret_cast<BacktraceFrames*>(data)->error_ = str.str();
}

int on_full(void* data, uintptr_t pc, const char* filename, int lineno, const char* function) {
  if (pc == static_cast<uintptr_t>(-1) && filename == nullptr && function == nullptr) {
    return 0;  // libbacktrace occasionally emits such a dummy frame
  }
  BacktraceFrames::SourceFrame frame;
  frame.address_ = pc;
  frame.srcfile_ = filename ? filename : "";
  frame.srclineno_ = lineno;
  frame.function_ = function ? function : "";
  reinterpret_cast<BacktraceFrames*>(data)->source_.push_back(frame);
  return 0;
}
}  // namespace

void BacktraceFrames::collect_glibc() {
  void* addresses[kMaxDepth];
  int depth = ::backtrace(addresses, kMaxDepth);
  char** symbols = ::backtrace_symbols(addresses, depth);
  if (symbols == nullptr) {
    error_ = "backtrace_symbols() failed";
    return;
  }
  for (int i = 1; i < depth; ++i) {  // skip collect_glibc() itself
    GlibcFrame frame;
    frame.address_ = addresses[i];
    frame.symbol_ = symbols[i];
    parse_glibc_symbol(&frame);
    glibc_.push_back(frame);
  }
  ::free(symbols);
}

std::vector<std::string> BacktraceFrames::format(uint16_t skip) const {
  std::vector<std::string> ret;
  if (!error_.empty()) {
    ret.push_back(error_);
  }
  for (size_t i = skip; i < glibc_.size(); ++i) {
    const GlibcFrame& libc = glibc_[i];
    std::stringstream str;
    str << "in ";
    if (i < source_.size() && !source_[i].function_.empty()) {
      const SourceFrame& src = source_[i];
      str << demangle_type_name(src.function_.c_str())
        << " " << src.srcfile_ << ":" << src.srclineno_
        << "  (" << libc.binary_path_ << ")  [" << Hex(src.address_) << "]";
    } else {
      str << (libc.function_.empty() ? std::string("???")
        : demangle_type_name(libc.function_.c_str()));
      str << " : " << libc.symbol_;
    }
    ret.push_back(str.str());
  }
  return ret;
}

std::vector<std::string> get_backtrace(bool rich) {
  BacktraceFrames frames;
  frames.collect_glibc();
  if (rich) {
    backtrace_state* state = ::backtrace_create_state(
      nullptr,  // figure out this executable
      0,  // single-threaded use of the state
      on_create_state_error,
      &frames);
    if (state) {
      int result = ::backtrace_full(state, 0, on_full, on_full_error, &frames);
      if (result != 0) {
        std::cerr << "[STRATA] libbacktrace backtrace_full returned " << result << std::endl;
      }
    }
  }
  return frames.format(1);  // skip get_backtrace() itself
}

}  // namespace assorted
}  // namespace strata
