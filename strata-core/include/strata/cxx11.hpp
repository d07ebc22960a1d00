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
#ifndef STRATA_CXX11_HPP_
#define STRATA_CXX11_HPP_

/**
 * @defgroup CXX11 C++11 Keywords in Public Headers
 * @ingroup IDIOMS
 * @brief Macros that hide C++11 keywords from public headers.
 * @details
 * libstrata itself is always compiled with C++11, but the public headers (everything except
 * xxx_impl.hpp) should at least compile for a C++98 client. Such a client sees the macros below
 * expanded to nothing (or to NULL for CXX11_NULLPTR), and APIs that inherently need C++11,
 * such as move constructors, are hidden behind DISABLE_CXX11_IN_PUBLIC_HEADERS.
 *
 * We include stdint.h rather than cstdint in public headers for the same reason.
 */

#if __cplusplus < 201103L
#ifndef NO_STRATA_CXX11_WARNING
#pragma message("C++11 is disabled. libstrata can be used without C++11,")
#pragma message(" but a few APIs (eg move of reclaim::Guard) are hidden.")
#pragma message(" To suppress this warning without enabling C++11, set -DNO_STRATA_CXX11_WARNING.")
#endif  // NO_STRATA_CXX11_WARNING
/**
 * @def DISABLE_CXX11_IN_PUBLIC_HEADERS
 * @ingroup CXX11
 * @brief If defined, our public headers must hide all C++11 dependent APIs.
 */
#define DISABLE_CXX11_IN_PUBLIC_HEADERS
#endif  // __cplusplus < 201103L

#ifdef DISABLE_CXX11_IN_PUBLIC_HEADERS
#define CXX11_FUNC_DELETE
#define CXX11_FUNC_DEFAULT
#define CXX11_CONSTEXPR
#define CXX11_FINAL
#define CXX11_NULLPTR NULL
#define CXX11_NOEXCEPT
#define CXX11_OVERRIDE
#define CXX11_STATIC_ASSERT(expr, message)
#else   // DISABLE_CXX11_IN_PUBLIC_HEADERS
#define CXX11_FUNC_DELETE = delete
#define CXX11_FUNC_DEFAULT = default
#define CXX11_CONSTEXPR constexpr
#define CXX11_FINAL final
#define CXX11_NULLPTR nullptr
#define CXX11_NOEXCEPT noexcept
#define CXX11_OVERRIDE override
#define CXX11_STATIC_ASSERT(expr, message) static_assert(expr, message)
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

#endif  // STRATA_CXX11_HPP_
