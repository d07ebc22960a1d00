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
#ifndef STRATA_ERROR_STACK_BATCH_HPP_
#define STRATA_ERROR_STACK_BATCH_HPP_

#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "strata/cxx11.hpp"
#include "strata/error_stack.hpp"

namespace strata {

/**
 * @brief Collects errors from a sequence of calls that must all run even if some fail.
 * @ingroup ERRORCODES
 * @details
 * The typical use is uninitialization: PageCache uninitializes the page table, the reclaimer
 * and the logging supports in reverse order, and a failure in one must not skip the others.
 * @code{.cpp}
 * ErrorStackBatch batch;
 * batch.push_back(page_table_.uninitialize());
 * batch.push_back(reclaimer_.uninitialize());
 * return SUMMARIZE_ERROR_BATCH(batch);
 * @endcode
 */
class ErrorStackBatch {
 public:
  ErrorStackBatch() {}

  void clear() { error_batch_.clear(); }

  /** Adds the given ErrorStack to the end of this batch if it is an error. */
  void push_back(const ErrorStack &error_stack) {
    if (!error_stack.is_error()) {
      return;
    }
    error_batch_.push_back(error_stack);
  }

  /** Returns whether there was any error. */
  bool        is_error() const { return !error_batch_.empty(); }
  size_t      size() const { return error_batch_.size(); }

  /**
   * kRetOk if nothing failed, the only error as-is if one failed,
   * or kErrorCodeBatchedError describing all of them.
   * Consider using SUMMARIZE_ERROR_BATCH(batch).
   */
  ErrorStack  summarize(const char* filename, const char* func, uint32_t linenum) const;

  friend std::ostream& operator<<(std::ostream& o, const ErrorStackBatch& obj);

 private:
  std::vector<ErrorStack> error_batch_;
};
}  // namespace strata

#define SUMMARIZE_ERROR_BATCH(x) x.summarize(__FILE__, __FUNCTION__, __LINE__)

#endif  // STRATA_ERROR_STACK_BATCH_HPP_
