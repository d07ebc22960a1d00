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
#ifndef STRATA_ERROR_CODE_HPP_
#define STRATA_ERROR_CODE_HPP_

/**
 * @defgroup ERRORCODES Error codes, messages, and stacktraces
 * @ingroup IDIOMS
 * @brief Error codes (strata::ErrorCode) and their messages defined in error_code.xmacro, and
 * stacktrace information (ErrorStack) returned by our API functions.
 * @details
 * @par X-Macros
 * Every error code, its name and its message is one line in error_code.xmacro. This header
 * includes that file three times to generate the enum and the two lookup functions, so adding
 * an error is a one-line change with no code generation.
 *
 * @par ErrorCode vs ErrorStack
 * strata::ErrorCode is merely an integer. Hot-path functions, such as the page table's
 * compare-and-swap or PagePointer::read_checked(), return it because it costs nothing.
 * Module-level functions (initialize(), loading configuration) return ErrorStack, which also
 * carries a stacktrace and an optional custom message.
 *
 * @par Contract violations are not errors
 * Asking a Heap pointer for its log offset's record, or packing a log offset of 2^48, is a
 * programming error rather than a runtime condition. Such calls die with LOG(FATAL).
 */

namespace strata {

#define X(a, b, c) /** b: c. */ a = b,
/**
 * @var ErrorCode
 * @ingroup ERRORCODES
 * @brief Enum of error codes defined in error_code.xmacro.
 */
enum ErrorCode {
  /** 0 means no-error. */
  kErrorCodeOk = 0,
#include "strata/error_code.xmacro" // NOLINT
};
#undef X

/**
 * @brief Returns the names of ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_name(ErrorCode code);

/**
 * @brief Returns the error messages corresponding to ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_message(ErrorCode code);

#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b, c) case a: return X_EXPAND_AND_QUOTE(a);
inline const char* get_error_name(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "kErrorCodeOk";
#include "strata/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE

#define X(a, b, c) case a: return c;
inline const char* get_error_message(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "no_error";
#include "strata/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
}  // namespace strata

/**
 * @def CHECK_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief
 * Calls \b x and, if it returns anything but kErrorCodeOk, immediately returns that code.
 * @code{.cpp}
 * ErrorCode your_func() {
 *   CHECK_ERROR_CODE(another_func());
 *   return kErrorCodeOk;
 * }
 * @endcode
 * @see WRAP_ERROR_CODE(x)
 */
#define CHECK_ERROR_CODE(x)\
{\
  strata::ErrorCode __e = x;\
  if (UNLIKELY(__e != strata::kErrorCodeOk)) {\
    return __e;\
  }\
}

#endif  // STRATA_ERROR_CODE_HPP_
