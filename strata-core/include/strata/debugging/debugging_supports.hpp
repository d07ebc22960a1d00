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
#ifndef STRATA_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
#define STRATA_DEBUGGING_DEBUGGING_SUPPORTS_HPP_

#include <string>

#include "strata/cxx11.hpp"
#include "strata/initializable.hpp"
#include "strata/debugging/debugging_options.hpp"

namespace strata {
namespace debugging {
/**
 * @brief Initializes glog for the process and exposes runtime knobs of it.
 * @ingroup DEBUGGING
 * @details
 * glog can be initialized only once per process while several PageCache instances (eg in
 * tests) may come and go. The first DebuggingSupports to initialize sets glog's flags from its
 * DebuggingOptions and calls google::InitGoogleLogging(). The last one to uninitialize shuts it
 * down. The others only count.
 * PageCache initializes this first and uninitializes it last, so every other module can log.
 */
class DebuggingSupports CXX11_FINAL : public DefaultInitializable {
 public:
  DebuggingSupports() CXX11_FUNC_DELETE;
  explicit DebuggingSupports(const DebuggingOptions* options) : options_(options) {}
  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /** @copydoc DebuggingOptions#debug_log_to_stderr_ */
  void                set_debug_log_to_stderr(bool value);
  /** @copydoc DebuggingOptions#debug_log_stderr_threshold_ */
  void                set_debug_log_stderr_threshold(DebuggingOptions::DebugLogLevel level);
  /** @copydoc DebuggingOptions#debug_log_min_threshold_ */
  void                set_debug_log_min_threshold(DebuggingOptions::DebugLogLevel level);
  /** @copydoc DebuggingOptions#verbose_log_level_ */
  void                set_verbose_log_level(int verbose);
  /** @copydoc DebuggingOptions#verbose_modules_ */
  void                set_verbose_module(const std::string &module, int verbose);

  /** Number of live DebuggingSupports that have initialized glog in this process. */
  static int          get_glog_user_count();

 private:
  void                initialize_glog();
  void                uninitialize_glog();

  const DebuggingOptions* const options_;
};
}  // namespace debugging
}  // namespace strata
#endif  // STRATA_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
