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
#include "strata/pagecache/pointer_read.hpp"

#include <glog/logging.h>

#include <ostream>

#include "strata/assert_nd.hpp"
#include "strata/compiler.hpp"
#include "strata/cxx11.hpp"
#include "strata/pagecache/persisted_records.hpp"
#include "strata/reclaim/epoch_reclaimer.hpp"

namespace strata {
namespace pagecache {

////////////////////////////////////////////////////////////////////////////////
///
///       LogOffsetCursor
///
////////////////////////////////////////////////////////////////////////////////
LogOffsetCursor::LogOffsetCursor()
  : source_(kSourceNone), node_(CXX11_NULLPTR), position_(0), valid_(false), current_(0) {
}

LogOffsetCursor::LogOffsetCursor(log::LogOffset single)
  : source_(kSourceSingle), node_(CXX11_NULLPTR), position_(0), valid_(true), current_(single) {
}

LogOffsetCursor::LogOffsetCursor(const PersistedNode* node)
  : source_(kSourceNode), node_(node), position_(0), valid_(false), current_(0) {
  settle();
}

log::LogOffset LogOffsetCursor::get() const {
  if (UNLIKELY(!valid_)) {
    LOG(FATAL) << "LogOffsetCursor::get() called past the end";
  }
  return current_;
}

void LogOffsetCursor::next() {
  if (!valid_) {
    return;
  }
  if (source_ == kSourceSingle) {
    valid_ = false;
  } else {
    ASSERT_ND(source_ == kSourceNode);
    ++position_;
    settle();
  }
}

void LogOffsetCursor::settle() {
  valid_ = false;
  const uint32_t end = node_->frags_.size() + 1U;
  for (; position_ < end; ++position_) {
    const PagePointer& pointer = position_ == 0 ? node_->base_ : node_->frags_[position_ - 1U];
    if (pointer.get_log_offset(&current_)) {
      valid_ = true;
      return;
    }
  }
}

////////////////////////////////////////////////////////////////////////////////
///
///       PointerRead
///
////////////////////////////////////////////////////////////////////////////////
PointerRead::PointerRead()
  : kind_(kPointerUnassigned),
    raw_kind_(kPointerUnassigned),
    size_class_(),
    heap_index_(0),
    log_offset_(),
    resident_(CXX11_NULLPTR),
    log_and_heap_(CXX11_NULLPTR) {
}

bool PointerRead::is_valid() const {
  return kind_ != kPointerUnassigned && kind_ != kPointerCorrupt;
}

void PointerRead::check_kind(PointerKind expected, const char* accessor) const {
  if (UNLIKELY(kind_ != expected)) {
    LOG(FATAL) << accessor << " requires a " << get_pointer_kind_name(expected)
      << " pointer. This is " << *this;
  }
}

uint64_t PointerRead::encoded_size() const {
  if (UNLIKELY(!is_valid())) {
    LOG(FATAL) << "encoded_size() on an invalid pointer " << *this;
  }
  if (kind_ == kPointerFree) {
    return 0;
  }
  return size_class_.size();
}

heap::HeapId PointerRead::heap_id() const {
  check_kind(kPointerHeap, "heap_id()");
  return heap::HeapId::from_size_class_exponent(size_class_.get_exponent(), heap_index_);
}

const TruncatedLogOffset& PointerRead::get_log_offset() const {
  if (UNLIKELY(kind_ != kPointerLog && kind_ != kPointerFree)) {
    LOG(FATAL) << "get_log_offset() requires a Log or Free pointer. This is " << *this;
  }
  return log_offset_;
}

const LogAndHeap& PointerRead::as_log_and_heap() const {
  check_kind(kPointerLogAndHeap, "as_log_and_heap()");
  return *log_and_heap_;
}

const PersistedNode& PointerRead::as_node() const {
  check_kind(kPointerInMemory, "as_node()");
  if (UNLIKELY(resident_->kind_ != kResidentNode)) {
    LOG(FATAL) << "as_node() on a " << get_resident_kind_name(resident_->kind_) << " record";
  }
  return *static_cast<const PersistedNode*>(resident_);
}

const PersistedMeta& PointerRead::as_meta() const {
  check_kind(kPointerInMemory, "as_meta()");
  if (UNLIKELY(resident_->kind_ != kResidentMeta)) {
    LOG(FATAL) << "as_meta() on a " << get_resident_kind_name(resident_->kind_) << " record";
  }
  return *static_cast<const PersistedMeta*>(resident_);
}

const PersistedCounter& PointerRead::as_counter() const {
  check_kind(kPointerInMemory, "as_counter()");
  if (UNLIKELY(resident_->kind_ != kResidentCounter)) {
    LOG(FATAL) << "as_counter() on a " << get_resident_kind_name(resident_->kind_) << " record";
  }
  return *static_cast<const PersistedCounter*>(resident_);
}

const ResidentRecord& PointerRead::as_resident(PageId page_id) const {
  check_kind(kPointerInMemory, "as_resident()");
  ResidentKind expected = resident_kind_of(page_id);
  if (UNLIKELY(resident_->kind_ != expected)) {
    LOG(FATAL) << "Page " << page_id << " must hold a " << get_resident_kind_name(expected)
      << " record, but it points to a " << get_resident_kind_name(resident_->kind_);
  }
  return *resident_;
}

LogOffsetCursor PointerRead::log_offset_entries(PageId page_id) const {
  switch (kind_) {
  case kPointerHeap:
    return LogOffsetCursor();
  case kPointerLog:
  case kPointerFree:
    return LogOffsetCursor(log_offset_.to_offset());
  case kPointerLogAndHeap:
    return LogOffsetCursor(log_and_heap_->get_log_offset());
  case kPointerInMemory: {
    const ResidentRecord& record = as_resident(page_id);
    if (record.kind_ == kResidentNode) {
      return LogOffsetCursor(static_cast<const PersistedNode*>(&record));
    }
    log::LogOffset offset;
    if (record.base_.get_log_offset(&offset)) {
      return LogOffsetCursor(offset);
    }
    return LogOffsetCursor();
  }
  default:
    LOG(FATAL) << "log_offset_entries() on an invalid pointer " << *this;
    return LogOffsetCursor();
  }
}

bool PointerRead::exists_on_segment(
  log::LogOffset segment_offset,
  uint64_t segment_size,
  PageId page_id) const {
  if (UNLIKELY(segment_size == 0)) {
    LOG(FATAL) << "exists_on_segment() with segment_size 0";
  }
  const log::SegmentId target = log::to_segment_id(segment_offset, segment_size);
  for (LogOffsetCursor cursor = log_offset_entries(page_id); cursor.is_valid(); cursor.next()) {
    if (log::to_segment_id(cursor.get(), segment_size) == target) {
      return true;
    }
  }
  return false;
}

namespace {
void delete_resident(void* object) {
  delete static_cast<ResidentRecord*>(object);
}
void delete_log_and_heap(void* object) {
  delete static_cast<LogAndHeap*>(object);
}
}  // namespace

void PointerRead::defer_destroy(reclaim::Guard* guard) const {
  if (kind_ == kPointerInMemory) {
    guard->defer(&delete_resident, resident_);
  } else if (kind_ == kPointerLogAndHeap) {
    guard->defer(&delete_log_and_heap, log_and_heap_);
  }
}

void PointerRead::destroy_immediately() const {
  if (kind_ == kPointerInMemory) {
    delete resident_;
  } else if (kind_ == kPointerLogAndHeap) {
    delete log_and_heap_;
  }
}

std::ostream& operator<<(std::ostream& o, const PointerRead& v) {
  o << "<PointerRead kind=\"" << get_pointer_kind_name(v.kind_) << "\"";
  switch (v.kind_) {
  case kPointerInMemory:
    o << " size_class=\"" << static_cast<int>(v.size_class_.get_exponent())
      << "\" address=\"" << v.resident_ << "\" />";
    break;
  case kPointerLogAndHeap:
    o << " size_class=\"" << static_cast<int>(v.size_class_.get_exponent())
      << "\" address=\"" << v.log_and_heap_ << "\" />";
    break;
  case kPointerHeap:
    o << ">" << v.heap_id() << "</PointerRead>";
    break;
  case kPointerLog:
    o << " size_class=\"" << static_cast<int>(v.size_class_.get_exponent())
      << "\" offset=\"" << v.log_offset_.to_offset() << "\" />";
    break;
  case kPointerFree:
    o << " offset=\"" << v.log_offset_.to_offset() << "\" />";
    break;
  case kPointerCorrupt:
    o << " kind_byte=\"" << static_cast<int>(v.raw_kind_)
      << "\" size_class=\"" << static_cast<int>(v.size_class_.get_exponent()) << "\" />";
    break;
  default:
    o << " />";
    break;
  }
  return o;
}

}  // namespace pagecache
}  // namespace strata
