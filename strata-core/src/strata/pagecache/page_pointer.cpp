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
#include "strata/pagecache/page_pointer.hpp"

#include <glog/logging.h>

#include <ostream>

#include "strata/assert_nd.hpp"
#include "strata/compiler.hpp"
#include "strata/pagecache/persisted_records.hpp"
#include "strata/pagecache/pointer_read.hpp"
#include "strata/pagecache/truncated_log_offset.hpp"

namespace strata {
namespace pagecache {

/** Addresses must be below this to be packed into the 6-byte payload. */
const uintptr_t kAddressLimit = static_cast<uintptr_t>(1ULL << (PagePointer::kPayloadBytes * 8));

const char* get_pointer_kind_name(PointerKind kind) {
  switch (kind) {
  case kPointerInMemory: return "InMemory";
  case kPointerHeap: return "Heap";
  case kPointerLog: return "Log";
  case kPointerLogAndHeap: return "LogAndHeap";
  case kPointerFree: return "Free";
  case kPointerUnassigned: return "Unassigned";
  case kPointerCorrupt: return "Corrupt";
  default: return "Unknown";
  }
}

PagePointer::PagePointer() {
  for (uint16_t i = 0; i < kBytes; ++i) {
    bytes_[i] = 0;
  }
  bytes_[kKindByte] = kPointerUnassigned;
}

PagePointer PagePointer::from_bits(uint64_t bits) {
  PagePointer ret;
  for (uint16_t i = 0; i < kBytes; ++i) {
    ret.bytes_[i] = static_cast<uint8_t>(bits >> (i * 8U));
  }
  return ret;
}

uint64_t PagePointer::to_bits() const {
  uint64_t bits = 0;
  for (uint16_t i = 0; i < kBytes; ++i) {
    bits |= static_cast<uint64_t>(bytes_[i]) << (i * 8U);
  }
  return bits;
}

PagePointer PagePointer::pack_address(
  const void* address,
  SizeClass size_class,
  PointerKind kind) {
  uintptr_t value = reinterpret_cast<uintptr_t>(address);
  if (UNLIKELY(value >= kAddressLimit)) {
    LOG(FATAL) << "Address " << address << " does not fit in " << (kPayloadBytes * 8)
      << " bits. This platform's address space is not supported";
  }
  PagePointer ret;
  for (uint16_t i = 0; i < kPayloadBytes; ++i) {
    ret.bytes_[i] = static_cast<uint8_t>(value >> (i * 8U));
  }
  ret.bytes_[kSizeClassByte] = size_class.get_exponent();
  ret.bytes_[kKindByte] = kind;
  return ret;
}

uintptr_t PagePointer::unpack_address() const {
  uintptr_t value = 0;
  for (uint16_t i = 0; i < kPayloadBytes; ++i) {
    value |= static_cast<uintptr_t>(bytes_[i]) << (i * 8U);
  }
  return value;
}

PagePointer PagePointer::new_in_memory(SizeClass size_class, ResidentRecord* record) {
  ASSERT_ND(record);
  return pack_address(record, size_class, kPointerInMemory);
}

PagePointer PagePointer::new_heap(const heap::HeapId& heap_id) {
  if (UNLIKELY(heap_id.slab_ > heap::kMaxSlab)) {
    LOG(FATAL) << "Heap slab " << static_cast<int>(heap_id.slab_) << " is above the largest slab "
      << static_cast<int>(heap::kMaxSlab);
  }
  PagePointer ret;
  uint32_t index = heap_id.index_;
  for (uint16_t i = 0; i < sizeof(uint32_t); ++i) {
    ret.bytes_[i] = static_cast<uint8_t>(index >> (i * 8U));
  }
  ret.bytes_[kSizeClassByte] = heap_id.get_size_class_exponent();
  ret.bytes_[kKindByte] = kPointerHeap;
  return ret;
}

PagePointer PagePointer::new_log(SizeClass size_class, log::LogOffset offset) {
  return new_log_offset_pointer(kPointerLog, size_class, offset);
}

PagePointer PagePointer::new_free(log::LogOffset offset) {
  return new_log_offset_pointer(kPointerFree, SizeClass(0), offset);
}

PagePointer PagePointer::new_log_offset_pointer(
  PointerKind kind,
  SizeClass size_class,
  log::LogOffset offset) {
  if (UNLIKELY(kind != kPointerLog && kind != kPointerFree)) {
    LOG(FATAL) << "Kind " << get_pointer_kind_name(kind) << " does not carry a log offset";
  }
  PagePointer ret;
  TruncatedLogOffset::from_offset(offset).copy_to(ret.bytes_);
  ret.bytes_[kSizeClassByte] = size_class.get_exponent();
  ret.bytes_[kKindByte] = kind;
  return ret;
}

PagePointer PagePointer::new_log_and_heap(
  SizeClass size_class,
  log::LogOffset offset,
  const heap::HeapId& heap_id,
  log::Lsn lsn) {
  // validate before allocating so that a bad offset does not leak the record
  TruncatedLogOffset truncated = TruncatedLogOffset::from_offset(offset);
  LogAndHeap* record = new LogAndHeap(truncated, heap_id, lsn);
  return pack_address(record, size_class, kPointerLogAndHeap);
}

PointerRead PagePointer::read() const {
  PointerRead ret;
  ret.raw_kind_ = bytes_[kKindByte];
  ret.size_class_ = get_size_class();
  if (UNLIKELY(bytes_[kKindByte] > kPointerUnassigned)) {
    ret.kind_ = kPointerCorrupt;
    return ret;
  }
  PointerKind kind = static_cast<PointerKind>(bytes_[kKindByte]);
  if (kind == kPointerUnassigned) {
    ret.kind_ = kPointerUnassigned;
    return ret;
  }
  if (UNLIKELY(!ret.size_class_.is_valid())) {
    ret.kind_ = kPointerCorrupt;
    return ret;
  }

  ret.kind_ = kind;
  switch (kind) {
  case kPointerInMemory:
    ret.resident_ = reinterpret_cast<ResidentRecord*>(unpack_address());
    break;
  case kPointerLogAndHeap:
    ret.log_and_heap_ = reinterpret_cast<LogAndHeap*>(unpack_address());
    break;
  case kPointerHeap:
    if (UNLIKELY(ret.size_class_.get_exponent() < heap::kMinTrailingZeros)) {
      ret.kind_ = kPointerCorrupt;
      return ret;
    }
    ret.heap_index_ = 0;
    for (uint16_t i = 0; i < sizeof(uint32_t); ++i) {
      ret.heap_index_ |= static_cast<uint32_t>(bytes_[i]) << (i * 8U);
    }
    break;
  case kPointerLog:
  case kPointerFree:
    ret.log_offset_ = TruncatedLogOffset::from_bytes(bytes_);
    break;
  default:
    ASSERT_ND(false);
  }
  return ret;
}

ErrorCode PagePointer::read_checked(PointerRead* out) const {
  *out = read();
  if (out->get_kind() == kPointerUnassigned) {
    return kErrorCodePcUnassignedPointer;
  } else if (out->get_kind() == kPointerCorrupt) {
    return kErrorCodePcCorruptPointer;
  }
  return kErrorCodeOk;
}

void PagePointer::forget_heap_log_coordinates() {
  if (get_kind() != kPointerLogAndHeap) {
    return;
  }
  const LogAndHeap* record = reinterpret_cast<const LogAndHeap*>(unpack_address());
  *this = new_heap(record->heap_id_);
}

bool PagePointer::get_log_offset(log::LogOffset* out) const {
  PointerKind kind = get_kind();
  if (kind != kPointerLog && kind != kPointerFree) {
    return false;
  }
  *out = TruncatedLogOffset::from_bytes(bytes_).to_offset();
  return true;
}

bool PagePointer::is_heap_resident() const {
  PointerKind kind = get_kind();
  return kind == kPointerHeap || kind == kPointerLogAndHeap;
}

heap::HeapId PagePointer::heap_id() const {
  if (UNLIKELY(get_kind() != kPointerHeap)) {
    LOG(FATAL) << "heap_id() called on a non-Heap pointer " << *this;
  }
  uint32_t index = 0;
  for (uint16_t i = 0; i < sizeof(uint32_t); ++i) {
    index |= static_cast<uint32_t>(bytes_[i]) << (i * 8U);
  }
  return heap::HeapId::from_size_class_exponent(bytes_[kSizeClassByte], index);
}

bool PagePointer::is_lone_log_and_heap() const {
  return get_kind() == kPointerLogAndHeap;
}

bool PagePointer::is_inline() const {
  return get_kind() == kPointerLog;
}

bool PagePointer::is_merged_into_snapshot() const {
  PointerKind kind = get_kind();
  return kind == kPointerHeap || kind == kPointerLog || kind == kPointerFree;
}

PointerKind PagePointer::get_kind() const {
  if (bytes_[kKindByte] > kPointerUnassigned) {
    return kPointerCorrupt;
  }
  return static_cast<PointerKind>(bytes_[kKindByte]);
}

bool PagePointer::operator==(const PagePointer& other) const {
  return to_bits() == other.to_bits();
}

std::ostream& operator<<(std::ostream& o, const PagePointer& v) {
  o << "<PagePointer bits=\"" << std::hex << v.to_bits() << std::dec << "\">"
    << v.read() << "</PagePointer>";
  return o;
}

}  // namespace pagecache
}  // namespace strata
