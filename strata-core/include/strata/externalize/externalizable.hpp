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
#ifndef STRATA_EXTERNALIZE_EXTERNALIZABLE_HPP_
#define STRATA_EXTERNALIZE_EXTERNALIZABLE_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "strata/cxx11.hpp"
#include "strata/error_stack.hpp"
#include "strata/assorted/assorted_func.hpp"

// forward declarations for tinyxml2, which ships no fwd header.
namespace tinyxml2 {
  class XMLDocument;
  class XMLElement;
}  // namespace tinyxml2

namespace strata {
namespace externalize {

/**
 * @brief Represents an object that can be written to and read from XML.
 * @ingroup EXTERNALIZE
 * @details
 * All option classes (StrataOptions and its children) derive from this, so that a whole
 * configuration can be saved to a file with comments describing each value and loaded back.
 * XML handling is done by tinyxml2. Implementations usually declare load()/save() with the
 * EXTERNALIZABLE(clazz) macro and write them with EXTERNALIZE_SAVE_ELEMENT and
 * EXTERNALIZE_LOAD_ELEMENT, which use the member's name as the tag.
 */
struct Externalizable {
  virtual ~Externalizable() {}

  /**
   * @brief Reads the content of this object from the given XML element.
   * @details
   * Expect errors due to missing-elements, out-of-range values, etc.
   */
  virtual ErrorStack load(tinyxml2::XMLElement* element) = 0;

  /**
   * @brief Writes the content of this object to the given XML element.
   * @details
   * The element is created by the parent, which decides the tag name.
   */
  virtual ErrorStack save(tinyxml2::XMLElement* element) const = 0;

  /** Tag name used only when this object is the root element. */
  virtual const char* get_tag_name() const = 0;

  /** Polymorphic assignment. other must be dynamic-castable to the assignee class. */
  virtual void assign(const strata::externalize::Externalizable *other) = 0;

  /** Invokes save() and writes the XML text to the given stream. */
  void        save_to_stream(std::ostream* ptr) const;

  /** Loads this object from an XML string whose root element represents this object. */
  ErrorStack  load_from_string(const std::string& xml);

  /** Loads this object from the given XML file. */
  ErrorStack  load_from_file(const std::string& path);

  /**
   * @brief Atomically writes out this object to the given XML file.
   * @details
   * Writes a temporary file next to it and renames it over the destination.
   */
  ErrorStack  save_to_file(const std::string& path) const;

  static ErrorStack insert_comment(tinyxml2::XMLElement* element, const std::string& comment);

  /** Explicitly instantiated in cpp for each type in INSTANTIATE_ALL_TYPES. */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, T value);

  /** enum version */
  template <typename ENUM>
  static ErrorStack add_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, ENUM value) {
    return add_element(parent, tag, comment, static_cast<int64_t>(value));
  }

  /** child Externalizable version */
  static ErrorStack add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, const Externalizable& child);

  /** Explicitly instantiated in cpp for each type in INSTANTIATE_ALL_TYPES. */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional = false, T value = T());

  /** enum version. Rejects values that do not survive the cast. */
  template <typename ENUM>
  static ErrorStack get_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
          ENUM* out, bool optional = false, ENUM default_value = static_cast<ENUM>(0)) {
    int64_t tmp;
    CHECK_ERROR(get_element<int64_t>(parent, tag, &tmp, optional, default_value));
    if (static_cast<int64_t>(static_cast<ENUM>(tmp)) != tmp) {
      return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
    }
    *out = static_cast<ENUM>(tmp);
    return kRetOk;
  }

  /** child Externalizable version */
  static ErrorStack get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
            Externalizable* child, bool optional = false);
};

}  // namespace externalize
}  // namespace strata

#define EX_QUOTE(str) #str
#define EX_EXPAND(str) EX_QUOTE(str)

#define EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_element(element, EX_EXPAND(attribute), comment, attribute))
#define EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_enum_element(element, EX_EXPAND(attribute), comment, attribute))

#define EXTERNALIZE_LOAD_ELEMENT(element, attribute) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute))
#define EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute, true, default_value))

#define EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute) \
  CHECK_ERROR(get_enum_element(element, EX_EXPAND(attribute), & attribute))

#define EXTERNALIZABLE(clazz) \
  ErrorStack load(tinyxml2::XMLElement* element) CXX11_OVERRIDE;\
  ErrorStack save(tinyxml2::XMLElement* element) const CXX11_OVERRIDE;\
  const char* get_tag_name() const CXX11_OVERRIDE { return EX_EXPAND(clazz); }\
  void assign(const strata::externalize::Externalizable *other) CXX11_OVERRIDE {\
    *this = *dynamic_cast< const clazz * >(other);\
  }\
  friend std::ostream& operator<<(std::ostream& o, const clazz & v) {\
    v.save_to_stream(&o);\
    return o;\
  }

#endif  // STRATA_EXTERNALIZE_EXTERNALIZABLE_HPP_
