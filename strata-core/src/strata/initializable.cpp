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
#include "strata/initializable.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <typeinfo>

#include "strata/assert_nd.hpp"
#include "strata/assorted/assorted_func.hpp"

namespace strata {
UninitializeGuard::~UninitializeGuard() {
  if (!target_->is_initialized()) {
    return;
  }
  if (policy_ != kSilent) {
    LOG(ERROR) << "UninitializeGuard found that "
      << assorted::demangle_type_name(typeid(*target_).name())
      << "#uninitialize() was not called before destruction. This is a BUG!";
  }
  if (policy_ == kAbortIfNotExplicitlyUninitialized) {
    LOG(FATAL) << "kAbortIfNotExplicitlyUninitialized policy. Aborting" << std::endl;
    std::abort();
  }

  ErrorStack error = target_->uninitialize();
  // target_ might be DebuggingSupports, so glog might be gone by now. Use stderr.
  if (error.is_error()) {
    switch (policy_) {
    case kAbortIfUninitializeError:
      std::cerr << "FATAL: UninitializeGuard got an error from uninitialize()."
        << " Aborting as we can't propagate it. error=" << error << std::endl;
      std::abort();
      break;
    case kWarnIfUninitializeError:
      std::cerr << "WARN: UninitializeGuard got an error from uninitialize()."
        << " It can't be propagated. error=" << error << std::endl;
      break;
    default:
      ASSERT_ND(policy_ == kSilent);
    }
  }
}
}  // namespace strata
