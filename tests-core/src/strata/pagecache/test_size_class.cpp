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
#include <stdint.h>
#include <gtest/gtest.h>

#include <sstream>

#include "strata/test_common.hpp"
#include "strata/pagecache/size_class.hpp"

namespace strata {
namespace pagecache {
DEFINE_TEST_CASE_PACKAGE(SizeClassTest, strata.pagecache);

TEST(SizeClassTest, Small) {
  EXPECT_EQ(0, SizeClass::from_length(0).get_exponent());
  EXPECT_EQ(0, SizeClass::from_length(1).get_exponent());
  EXPECT_EQ(1U, SizeClass::from_length(1).size());
  EXPECT_EQ(1, SizeClass::from_length(2).get_exponent());
  EXPECT_EQ(2, SizeClass::from_length(3).get_exponent());
  EXPECT_EQ(2, SizeClass::from_length(4).get_exponent());
  EXPECT_EQ(3, SizeClass::from_length(5).get_exponent());
}

TEST(SizeClassTest, PowersOfTwo) {
  for (uint8_t e = 0; e <= SizeClass::kMaxExponent; ++e) {
    uint64_t length = 1ULL << e;
    EXPECT_EQ(e, SizeClass::from_length(length).get_exponent()) << length;
    EXPECT_EQ(length, SizeClass::from_length(length).size());
    if (e >= 2) {
      EXPECT_EQ(e, SizeClass::from_length(length - 1U).get_exponent()) << length - 1U;
    }
    if (e < SizeClass::kMaxExponent && e >= 1) {
      EXPECT_EQ(e + 1, SizeClass::from_length(length + 1U).get_exponent()) << length + 1U;
    }
  }
}

TEST(SizeClassTest, TightBound) {
  const uint64_t kLengths[] = {2, 3, 7, 100, 4095, 4097, 32768, 1000000, 123456789012ULL};
  for (uint16_t i = 0; i < sizeof(kLengths) / sizeof(kLengths[0]); ++i) {
    uint64_t length = kLengths[i];
    SizeClass size_class = SizeClass::from_length(length);
    EXPECT_GE(size_class.size(), length);
    EXPECT_LT(size_class.size(), length * 2U);
  }
}

TEST(SizeClassTest, Monotonic) {
  SizeClass previous = SizeClass::from_length(0);
  for (uint64_t length = 1; length < 5000; ++length) {
    SizeClass current = SizeClass::from_length(length);
    EXPECT_FALSE(current < previous) << length;
    previous = current;
  }
}

TEST(SizeClassTest, Largest) {
  uint64_t largest = 1ULL << 63;
  EXPECT_EQ(63, SizeClass::from_length(largest).get_exponent());
  EXPECT_EQ(63, SizeClass::from_length(largest - 1U).get_exponent());
  EXPECT_EQ(largest, SizeClass::from_length(largest).size());
}

TEST(SizeClassTest, Validity) {
  EXPECT_TRUE(SizeClass(63).is_valid());
  EXPECT_FALSE(SizeClass(64).is_valid());
  EXPECT_FALSE(SizeClass(255).is_valid());
}

TEST(SizeClassTest, Print) {
  std::stringstream str;
  str << SizeClass::from_length(4000);
  EXPECT_EQ("<SizeClass exponent=\"12\" size=\"4096\" />", str.str());
}

TEST(SizeClassDeathTest, TooLarge) {
  EXPECT_DEATH(SizeClass::from_length((1ULL << 63) + 1U), "has no power-of-two size class");
  EXPECT_DEATH(SizeClass::from_length(~0ULL), "has no power-of-two size class");
}

TEST(SizeClassDeathTest, InvalidSize) {
  EXPECT_DEATH(SizeClass(64).size(), "overflows 64 bits");
}

}  // namespace pagecache
}  // namespace strata

TEST_MAIN_CAPTURE_SIGNALS(SizeClassTest, strata.pagecache);
