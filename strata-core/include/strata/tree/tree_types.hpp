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
#ifndef STRATA_TREE_TREE_TYPES_HPP_
#define STRATA_TREE_TREE_TYPES_HPP_
#include <stdint.h>

#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "strata/pagecache/page_id.hpp"

/**
 * @file strata/tree/tree_types.hpp
 * @brief Page contents as seen by the page cache.
 * @ingroup TREE
 * @details
 * The B-tree that reads and splits nodes is outside this library. The page cache only needs
 * to own these values inside resident records and print them, so they are plain data.
 */
namespace strata {
namespace tree {

/**
 * @brief One node of a tree: a key range, a sibling link and the sorted items in it.
 * @ingroup TREE
 */
struct Node {
  typedef std::pair<std::string, std::string> Item;

  Node() : next_(0) {}

  /** Inclusive low key of this node. */
  std::string         lo_;
  /** Exclusive high key. Empty means unbounded. */
  std::string         hi_;
  /** Right sibling, or 0 if this is the rightmost node. */
  pagecache::PageId   next_;
  std::vector<Item>   items_;

  bool operator==(const Node& other) const {
    return lo_ == other.lo_ && hi_ == other.hi_ && next_ == other.next_
      && items_ == other.items_;
  }
  friend std::ostream& operator<<(std::ostream& o, const Node& v);
};

/**
 * @brief Contents of the meta page: name of each tree to its root page.
 * @ingroup TREE
 */
struct Meta {
  typedef std::map<std::string, pagecache::PageId> RootMap;

  /** Returns the root of the named tree, or 0 if there is no such tree. */
  pagecache::PageId get_root(const std::string& name) const {
    RootMap::const_iterator it = roots_.find(name);
    return it == roots_.end() ? 0 : it->second;
  }
  void set_root(const std::string& name, pagecache::PageId root) { roots_[name] = root; }

  RootMap roots_;

  bool operator==(const Meta& other) const { return roots_ == other.roots_; }
  friend std::ostream& operator<<(std::ostream& o, const Meta& v);
};

}  // namespace tree
}  // namespace strata
#endif  // STRATA_TREE_TREE_TYPES_HPP_
