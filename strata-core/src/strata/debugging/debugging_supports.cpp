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
#include "strata/debugging/debugging_supports.hpp"

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <mutex>
#include <string>

#include "strata/assert_nd.hpp"

namespace strata {
namespace debugging {
/**
 * @brief Number of DebuggingSupports that currently hold glog.
 * @details
 * glog must be initialized and shut down once per process. The one that observes 0 on
 * increment initializes it; the one that observes 1 on decrement shuts it down.
 * Protected by static_glog_initialize_lock.
 * @invariant 0 or larger.
 */
int         static_glog_initialize_counter = 0;

std::mutex  static_glog_initialize_lock;

void DebuggingSupports::initialize_glog() {
  std::lock_guard<std::mutex> guard(static_glog_initialize_lock);
  ASSERT_ND(static_glog_initialize_counter >= 0);
  if (static_glog_initialize_counter == 0) {
    FLAGS_logtostderr = options_->debug_log_to_stderr_;
    FLAGS_stderrthreshold = static_cast<int>(options_->debug_log_stderr_threshold_);
    FLAGS_minloglevel = static_cast<int>(options_->debug_log_min_threshold_);
    FLAGS_log_dir = options_->debug_log_dir_;  // must be set BEFORE InitGoogleLogging()
    FLAGS_v = options_->verbose_log_level_;
    if (!options_->verbose_modules_.empty()) {
      google::SetVLOGLevel(options_->verbose_modules_.c_str(), options_->verbose_log_level_);
    }
    // glog keeps this pointer, so it must be a string literal
    google::InitGoogleLogging("libstrata");
    LOG(INFO) << "initialize_glog(): Initialized GLOG";
  } else {
    LOG(INFO) << "initialize_glog(): Observed that someone else has initialized GLOG";
  }
  ++static_glog_initialize_counter;
}

void DebuggingSupports::uninitialize_glog() {
  std::lock_guard<std::mutex> guard(static_glog_initialize_lock);
  ASSERT_ND(static_glog_initialize_counter >= 1);
  if (static_glog_initialize_counter == 1) {
    LOG(INFO) << "uninitialize_glog(): Uninitializing GLOG...";
    google::ShutdownGoogleLogging();
  } else {
    LOG(INFO) << "uninitialize_glog(): There are still some other GLOG user.";
  }
  --static_glog_initialize_counter;
}

int DebuggingSupports::get_glog_user_count() {
  std::lock_guard<std::mutex> guard(static_glog_initialize_lock);
  return static_glog_initialize_counter;
}

ErrorStack DebuggingSupports::initialize_once() {
  initialize_glog();  // we can use glog since now
  return kRetOk;
}

ErrorStack DebuggingSupports::uninitialize_once() {
  uninitialize_glog();  // we can't use glog since now
  return kRetOk;
}

void DebuggingSupports::set_debug_log_to_stderr(bool value) {
  FLAGS_logtostderr = value;
  LOG(INFO) << "Changed glog's FLAGS_logtostderr to " << value;
}
void DebuggingSupports::set_debug_log_stderr_threshold(DebuggingOptions::DebugLogLevel level) {
  FLAGS_stderrthreshold = static_cast<int>(level);
  LOG(INFO) << "Changed glog's FLAGS_stderrthreshold to " << level;
}
void DebuggingSupports::set_debug_log_min_threshold(DebuggingOptions::DebugLogLevel level) {
  FLAGS_minloglevel = static_cast<int>(level);
  LOG(INFO) << "Changed glog's FLAGS_minloglevel to " << level;
}
void DebuggingSupports::set_verbose_log_level(int verbose) {
  FLAGS_v = verbose;
  LOG(INFO) << "Changed glog's FLAGS_v to " << verbose;
}
void DebuggingSupports::set_verbose_module(const std::string &module, int verbose) {
  google::SetVLOGLevel(module.c_str(), verbose);
  LOG(INFO) << "Invoked google::SetVLOGLevel for " << module << ", level=" << verbose;
}

}  // namespace debugging
}  // namespace strata
