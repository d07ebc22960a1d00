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
#ifndef STRATA_STRATA_OPTIONS_HPP_
#define STRATA_STRATA_OPTIONS_HPP_

#include "strata/cxx11.hpp"
#include "strata/debugging/debugging_options.hpp"
#include "strata/externalize/externalizable.hpp"
#include "strata/pagecache/pagecache_options.hpp"
#include "strata/reclaim/reclaim_options.hpp"

namespace strata {
/**
 * @brief Set of option values given to the page cache at start-up.
 * @ingroup PAGECACHE
 * @details
 * A collection of the settings of individual modules (XxxOptions). Instantiate it with
 * default values, modify the values you need, then give it to PageCache.
 *
 * It can be saved to and loaded from an XML file:
 * @code{.cpp}
 * StrataOptions options;
 * options.pagecache_.segment_size_ = 1 << 20;
 * if (options.save_to_file("/your/path/to/strata_config.xml").is_error()) {
 *    // handle errors. It might be file permission issue or other file I/O issues.
 * }
 * ...
 * if (options.load_from_file("/your/path/to/strata_config.xml").is_error()) {
 *    // handle errors. It might be file permission, corrupted XML files, etc.
 * }
 * @endcode
 */
struct StrataOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /** Constructs option values with default values. */
  StrataOptions();
  StrataOptions(const StrataOptions& other);
  StrataOptions& operator=(const StrataOptions& other);

  debugging::DebuggingOptions   debugging_;
  reclaim::ReclaimOptions       reclaim_;
  pagecache::PagecacheOptions   pagecache_;

  EXTERNALIZABLE(StrataOptions);
};
}  // namespace strata
#endif  // STRATA_STRATA_OPTIONS_HPP_
