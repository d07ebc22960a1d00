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
#ifndef STRATA_ASSORTED_ASSORTED_FUNC_HPP_
#define STRATA_ASSORTED_ASSORTED_FUNC_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <typeinfo>

#include "strata/cxx11.hpp"

/**
 * @defgroup ASSORTED Assorted Methods/Classes
 * @ingroup IDIOMS
 * @brief Small helpers shared by all packages.
 */

namespace strata {
namespace assorted {

/**
 * @brief Thread-safe strerror(errno). We might do some trick here for portability, too.
 * @ingroup ASSORTED
 */
std::string os_error();

/**
 * @brief This version receives errno.
 * @ingroup ASSORTED
 */
std::string os_error(int error_number);

/**
 * @brief Convenient way of writing hex integers to stream.
 * @ingroup ASSORTED
 * @details
 * @code{.cpp}
 * std::cout << Hex(1234) << ...
 * // same as std::cout << "0x" << std::hex << std::uppercase << 1234 << ...
 * // but it restores the stream flags afterwards.
 * @endcode
 */
struct Hex {
  template<typename T>
  Hex(T val, int fix_digits = -1) : val_(static_cast<uint64_t>(val)), fix_digits_(fix_digits) {}

  uint64_t val_;
  int fix_digits_;
  friend std::ostream& operator<<(std::ostream& o, const Hex& v);
};

/**
 * Alternative for static_assert(sizeof(foo) == sizeof(bar), "oh crap") to display sizeof(foo).
 * @ingroup ASSORTED
 * @details
 * Use it like this:
 * @code{.cpp}
 * STATIC_SIZE_CHECK(sizeof(foo), sizeof(bar))
 * @endcode
 */
template<uint64_t SIZE1, uint64_t SIZE2>
inline int static_size_check() {
  CXX11_STATIC_ASSERT(SIZE1 == SIZE2,
    "Static Size Check failed. Look for 'In instantiation of int"
    " strata::assorted::static_size_check() [with SIZE1 = ..; SIZE2 = ..]' to see the values");
  return 0;
}

/**
 * @brief Demangle the given C++ type name \e if possible (otherwise the original string).
 * @ingroup ASSORTED
 */
std::string demangle_type_name(const char* mangled_name);

/**
 * @brief Returns the name of the C++ type as readable as possible.
 * @ingroup ASSORTED
 */
template <typename T>
std::string get_pretty_type_name() {
  return demangle_type_name(typeid(T).name());
}

}  // namespace assorted
}  // namespace strata

#define STATIC_SIZE_CHECK_CONCAT_DETAIL(x, y) x##y
#define STATIC_SIZE_CHECK_CONCAT(x, y) STATIC_SIZE_CHECK_CONCAT_DETAIL(x, y)
#define STATIC_SIZE_CHECK_METHOD_NAME \
  STATIC_SIZE_CHECK_CONCAT(_dummy_static_size_check, __COUNTER__)
#define STATIC_SIZE_CHECK(desired, actual) \
  inline void STATIC_SIZE_CHECK_METHOD_NAME() { \
    strata::assorted::static_size_check< desired, actual >();\
  }

/**
 * @def INSTANTIATE_ALL_TYPES(M)
 * @brief Explicitly instantiates the given template for bool, float, double, all fixed-width
 * integers and std::string.
 * @ingroup ASSORTED
 * @details
 * Declare the template in the header, define it in the cpp, then in the cpp:
 * @code{.cpp}
 * #define EXPLICIT_INSTANTIATION_COOL_FUNC(x) template void cool_func< x > (x arg);
 * INSTANTIATE_ALL_TYPES(EXPLICIT_INSTANTIATION_COOL_FUNC);
 * @endcode
 */
#define INSTANTIATE_ALL_INTEGER_TYPES(M) M(int64_t);  /** NOLINT(readability/function) */\
  M(int32_t); M(int16_t); M(int8_t); M(uint64_t);  /** NOLINT(readability/function) */\
  M(uint32_t); M(uint16_t); M(uint8_t); /** NOLINT(readability/function) */

#define INSTANTIATE_ALL_NUMERIC_TYPES(M) INSTANTIATE_ALL_INTEGER_TYPES(M);\
  M(bool); M(float); M(double); /** NOLINT(readability/function) */

#define INSTANTIATE_ALL_TYPES(M) INSTANTIATE_ALL_NUMERIC_TYPES(M);\
  M(std::string);  /** NOLINT(readability/function) */

#endif  // STRATA_ASSORTED_ASSORTED_FUNC_HPP_
