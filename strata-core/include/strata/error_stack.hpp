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
#ifndef STRATA_ERROR_STACK_HPP_
#define STRATA_ERROR_STACK_HPP_

#include <errno.h>
#include <stdint.h>

#include <cstring>
#include <iosfwd>
#include <string>

#include "strata/assert_nd.hpp"
#include "strata/compiler.hpp"
#include "strata/cxx11.hpp"
#include "strata/error_code.hpp"

namespace strata {

/**
 * @brief Error code plus a short stacktrace, returned by module-level functions.
 * @ingroup ERRORCODES
 * @details
 * We do not throw exceptions. Functions that might fail at module level (initialization,
 * configuration, shutdown) return this object instead, and callers propagate it with
 * CHECK_ERROR(x). Each propagation appends the file, function and line to the stack, up to
 * kMaxStackDepth frames. The frames are const pointers from __FILE__/__FUNCTION__, so only a
 * custom message, which is rare, requires heap allocation.
 *
 * @par Checked return values
 * In DEBUG builds, destroying an error that nobody looked at (is_error() or
 * get_error_code()) aborts with "Return value is not checked".
 *
 * @par Copy is move
 * The copy constructor and copy assignment steal the custom message and the checked flag from
 * the source. This keeps the class usable from C++98 clients without paying for deep copies.
 */
class ErrorStack {
 public:
  enum Constants {
     /** Maximum stack trace depth. */
     kMaxStackDepth = 8,
  };

  /** Same as kRetOk. */
  ErrorStack();

  /** An error without stacktrace nor custom message. Cheapest way to return an error. */
  explicit ErrorStack(ErrorCode code);

  /**
   * @brief An error with its first stack frame and optionally a custom message.
   * @param[in] filename permanent string such as __FILE__. Not deep-copied.
   * @param[in] func permanent string such as __FUNCTION__. Not deep-copied.
   * @param[in] linenum usually __LINE__
   * @param[in] code must be a real error
   * @param[in] custom_message deep-copied if not null
   */
  ErrorStack(const char* filename, const char* func, uint32_t linenum, ErrorCode code,
        const char* custom_message = CXX11_NULLPTR);

  ErrorStack(const ErrorStack &other);

  /** Copies other and appends one stack frame (and optionally more message). */
  ErrorStack(const ErrorStack &other, const char* filename, const char* func, uint32_t linenum,
        const char* more_custom_message = CXX11_NULLPTR);

  ErrorStack& operator=(const ErrorStack &other);

  ~ErrorStack();

  bool                is_error() const;
  ErrorCode           get_error_code() const;
  /** Returns the message of the error code. */
  const char*         get_message() const;
  const char*         get_custom_message() const;

  void                copy_custom_message(const char* message);
  void                clear_custom_message();
  void                append_custom_message(const char* more_custom_message);

  uint16_t            get_stack_depth() const;
  uint32_t            get_linenum(uint16_t stack_index) const;
  const char*         get_filename(uint16_t stack_index) const;
  const char*         get_func(uint16_t stack_index) const;

  /** Aborts if the error code is not checked yet. */
  void                verify() const;

  /** Describe this object to the given stream. */
  void                output(std::ostream* ptr) const;

  /** Describe this object to LOG(FATAL), which aborts. */
  void                dump_and_abort(const char *abort_message) const;

  /** Returns what dump_and_abort() printed so far. Called by signal handlers. */
  static std::string  get_recent_dump_and_abort();

  friend std::ostream& operator<<(std::ostream& o, const ErrorStack& obj);

 private:
  /** filenames_[0] is where the error was first instantiated. */
  const char*     filenames_[kMaxStackDepth];
  const char*     funcs_[kMaxStackDepth];
  uint32_t        linenums_[kMaxStackDepth];

  /** Deep-copied custom message, or null. Mutable because copy is move. */
  mutable char*   custom_message_;

  /** errno when this object was instantiated. Might be unrelated to this error. */
  int             os_errno_;

  /**
   * @invariant If kErrorCodeOk, all other members except checked_ are meaningless and
   * every method returns early without touching them.
   */
  ErrorCode       error_code_;

  /** 0 means no stacktrace is collected for this error. */
  uint16_t        stack_depth_;

  mutable bool    checked_;
};

/**
 * @var kRetOk
 * @ingroup ERRORCODES
 * @brief Normal return value for no-error case.
 */
const ErrorStack kRetOk;

inline ErrorStack::ErrorStack()
  : custom_message_(CXX11_NULLPTR), os_errno_(0), error_code_(kErrorCodeOk),
    stack_depth_(0), checked_(true) {
}

inline ErrorStack::ErrorStack(ErrorCode code)
  : custom_message_(CXX11_NULLPTR), os_errno_(errno), error_code_(code),
    stack_depth_(0), checked_(false) {
}

inline ErrorStack::ErrorStack(const char* filename, const char* func, uint32_t linenum,
                ErrorCode code, const char* custom_message)
  : custom_message_(CXX11_NULLPTR), os_errno_(errno), error_code_(code), stack_depth_(1),
    checked_(false) {
  ASSERT_ND(code != kErrorCodeOk);
  filenames_[0] = filename;
  funcs_[0] = func;
  linenums_[0] = linenum;
  copy_custom_message(custom_message);
}

inline ErrorStack::ErrorStack(const ErrorStack &other)
  : custom_message_(CXX11_NULLPTR), error_code_(kErrorCodeOk), checked_(true) {
  operator=(other);
}

inline ErrorStack::ErrorStack(const ErrorStack &other, const char* filename,
              const char* func, uint32_t linenum, const char* more_custom_message)
  : custom_message_(CXX11_NULLPTR), error_code_(kErrorCodeOk), checked_(true) {
  operator=(other);
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  if (stack_depth_ != 0 && stack_depth_ < kMaxStackDepth) {
    filenames_[stack_depth_] = filename;
    funcs_[stack_depth_] = func;
    linenums_[stack_depth_] = linenum;
    ++stack_depth_;
  }
  if (more_custom_message) {
    append_custom_message(more_custom_message);
  }
}

inline ErrorStack& ErrorStack::operator=(const ErrorStack &other) {
  if (this == &other) {
    return *this;
  }
  clear_custom_message();
  if (LIKELY(other.error_code_ == kErrorCodeOk)) {
    error_code_ = kErrorCodeOk;
    checked_ = true;
    return *this;
  }

  custom_message_ = other.custom_message_;  // steal
  other.custom_message_ = CXX11_NULLPTR;
  stack_depth_ = other.stack_depth_;
  for (uint16_t i = 0; i < other.stack_depth_; ++i) {
    filenames_[i] = other.filenames_[i];
    funcs_[i] = other.funcs_[i];
    linenums_[i] = other.linenums_[i];
  }
  os_errno_ = other.os_errno_;
  error_code_ = other.error_code_;
  checked_ = false;
  other.checked_ = true;
  return *this;
}

inline ErrorStack::~ErrorStack() {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
#ifdef DEBUG
  verify();
#endif  // DEBUG
  clear_custom_message();
}

inline void ErrorStack::clear_custom_message() {
  if (UNLIKELY(custom_message_ != CXX11_NULLPTR)) {
    delete[] custom_message_;
    custom_message_ = CXX11_NULLPTR;
  }
}

inline void ErrorStack::copy_custom_message(const char* message) {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  clear_custom_message();
  if (message) {
    size_t len = std::strlen(message);
    custom_message_ = new char[len + 1];
    std::memcpy(custom_message_, message, len + 1);
  }
}

inline void ErrorStack::append_custom_message(const char* more_custom_message) {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  if (custom_message_ == CXX11_NULLPTR) {
    copy_custom_message(more_custom_message);
    return;
  }
  size_t cur_len = std::strlen(custom_message_);
  size_t more_len = std::strlen(more_custom_message);
  char* concat = new char[cur_len + more_len + 1];
  std::memcpy(concat, custom_message_, cur_len);
  std::memcpy(concat + cur_len, more_custom_message, more_len + 1);
  delete[] custom_message_;
  custom_message_ = concat;
}

inline bool ErrorStack::is_error() const {
  checked_ = true;
  return error_code_ != kErrorCodeOk;
}

inline ErrorCode ErrorStack::get_error_code() const {
  checked_ = true;
  return error_code_;
}

inline const char* ErrorStack::get_message() const {
  return get_error_message(error_code_);
}

inline const char* ErrorStack::get_custom_message() const {
  if (error_code_ == kErrorCodeOk) {
    return CXX11_NULLPTR;
  }
  return custom_message_;
}

inline uint16_t ErrorStack::get_stack_depth() const {
  if (error_code_ == kErrorCodeOk) {
    return 0;
  }
  return stack_depth_;
}

inline uint32_t ErrorStack::get_linenum(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return 0;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return linenums_[stack_index];
}

inline const char* ErrorStack::get_filename(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return CXX11_NULLPTR;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return filenames_[stack_index];
}

inline const char* ErrorStack::get_func(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return CXX11_NULLPTR;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return funcs_[stack_index];
}

inline void ErrorStack::verify() const {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  if (!checked_) {
    dump_and_abort("Return value is not checked. ErrorStack must be checked");
  }
}

}  // namespace strata

// The followings are macros. So, they belong to no namespaces.

/**
 * @def ERROR_STACK(e)
 * @ingroup ERRORCODES
 * @brief Instantiates ErrorStack with the current file, function and line.
 * @code{.cpp}
 * ErrorStack your_func() {
 *   if (capacity == 0) {
 *      return ERROR_STACK(kErrorCodeConfValueOutofrange);
 *   }
 *   return kRetOk;
 * }
 * @endcode
 */
#define ERROR_STACK(e)      strata::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e)

/**
 * @def ERROR_STACK_MSG(e, m)
 * @ingroup ERRORCODES
 * @brief ERROR_STACK(e) with a custom message, which is deep-copied.
 */
#define ERROR_STACK_MSG(e, m)   strata::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e, m)

/**
 * @def CHECK_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Calls \b x and, on error, returns it after appending the current stack frame.
 * @note The name is CHECK_ERROR, not CHECK, because glog defines CHECK.
 */
#define CHECK_ERROR(x)\
{\
  strata::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return strata::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__);\
  }\
}

/**
 * @def WRAP_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief Calls \b x, which returns ErrorCode, and on error returns it as ErrorStack.
 * @see CHECK_ERROR_CODE(x)
 */
#define WRAP_ERROR_CODE(x)\
{\
  strata::ErrorCode __e = x;\
  if (UNLIKELY(__e != strata::kErrorCodeOk)) {return ERROR_STACK(__e);}\
}

/**
 * @def CHECK_ERROR_MSG(x, m)
 * @ingroup ERRORCODES
 * @brief CHECK_ERROR(x) that also appends a custom message.
 */
#define CHECK_ERROR_MSG(x, m)\
{\
  strata::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return strata::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__, m);\
  }\
}

/**
 * @def CHECK_OUTOFMEMORY(ptr)
 * @ingroup ERRORCODES
 * @brief Returns kErrorCodeOutofmemory error stack if \b ptr is null.
 */
#define CHECK_OUTOFMEMORY(ptr)\
if (UNLIKELY(!ptr)) {\
  return strata::ErrorStack(__FILE__, __FUNCTION__, __LINE__, strata::kErrorCodeOutofmemory);\
}

/**
 * @def COERCE_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Calls \b x and aborts if it returns an error.
 * @details
 * For places whose signature is fixed elsewhere (destructors, thread bodies) and where an error
 * would anyway be catastrophic.
 */
#define COERCE_ERROR(x)\
{\
  strata::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    __e.dump_and_abort("Unexpected error happened");\
  }\
}

#endif  // STRATA_ERROR_STACK_HPP_
