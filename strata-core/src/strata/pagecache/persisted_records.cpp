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
#include "strata/pagecache/persisted_records.hpp"

#include <ostream>

#include "strata/pagecache/size_class.hpp"

namespace strata {
namespace pagecache {

const char* get_resident_kind_name(ResidentKind kind) {
  switch (kind) {
  case kResidentMeta: return "PersistedMeta";
  case kResidentCounter: return "PersistedCounter";
  case kResidentNode: return "PersistedNode";
  default: return "Unknown";
  }
}

PagePointer LogAndHeap::to_log_pointer() const {
  return PagePointer::new_log(SizeClass::from_length(heap_id_.slab_size()), get_log_offset());
}

std::ostream& operator<<(std::ostream& o, const PersistedMeta& v) {
  o << "<PersistedMeta><base>" << v.base_ << "</base>" << v.meta_ << "</PersistedMeta>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const PersistedCounter& v) {
  o << "<PersistedCounter counter=\"" << v.counter_ << "\"><base>" << v.base_ << "</base>"
    << "</PersistedCounter>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const PersistedNode& v) {
  o << "<PersistedNode ts=\"" << v.ts_ << "\"><base>" << v.base_ << "</base>";
  o << "<frags count=\"" << v.frags_.size() << "\">";
  for (uint32_t i = 0; i < v.frags_.size(); ++i) {
    o << v.frags_[i];
  }
  o << "</frags>" << v.node_ << "</PersistedNode>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const PersistedFree& v) {
  o << "<PersistedFree>" << v.page_pointer_ << "</PersistedFree>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const LogAndHeap& v) {
  o << "<LogAndHeap offset=\"" << v.get_log_offset() << "\" lsn=\"" << v.log_lsn_ << "\">"
    << v.heap_id_ << "</LogAndHeap>";
  return o;
}

}  // namespace pagecache
}  // namespace strata
