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
#include "strata/strata_options.hpp"

#include <tinyxml2.h>

#include <vector>

#include "strata/assert_nd.hpp"

namespace strata {
StrataOptions::StrataOptions() {
}
StrataOptions::StrataOptions(const StrataOptions& other) {
  operator=(other);
}

// template-ing just for const/non-const
template <typename OPTION_PTR, typename CHILD_PTR>
std::vector< CHILD_PTR > get_children_impl(OPTION_PTR option) {
  std::vector< CHILD_PTR > children;
  children.push_back(&option->debugging_);
  children.push_back(&option->reclaim_);
  children.push_back(&option->pagecache_);
  return children;
}
std::vector< externalize::Externalizable* > get_children(StrataOptions* option) {
  return get_children_impl<StrataOptions*, externalize::Externalizable*>(option);
}
std::vector< const externalize::Externalizable* > get_children(const StrataOptions* option) {
  return get_children_impl<const StrataOptions*, const externalize::Externalizable*>(option);
}

StrataOptions& StrataOptions::operator=(const StrataOptions& other) {
  std::vector< externalize::Externalizable* > mine = get_children(this);
  std::vector< const externalize::Externalizable* > others = get_children(&other);
  ASSERT_ND(mine.size() == others.size());
  for (size_t i = 0; i < mine.size(); ++i) {
    mine[i]->assign(others[i]);
  }
  return *this;
}

ErrorStack StrataOptions::load(tinyxml2::XMLElement* element) {
  *this = StrataOptions();  // This guarantees default values for optional XML elements.
  std::vector< externalize::Externalizable* > children = get_children(this);
  for (size_t i = 0; i < children.size(); ++i) {
    CHECK_ERROR(get_child_element(element, children[i]->get_tag_name(), children[i]));
  }
  return kRetOk;
}

ErrorStack StrataOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options given to the page cache at start-up"));
  std::vector< const externalize::Externalizable* > children = get_children(this);
  for (size_t i = 0; i < children.size(); ++i) {
    CHECK_ERROR(add_child_element(element, children[i]->get_tag_name(), "", *children[i]));
  }
  return kRetOk;
}

}  // namespace strata
