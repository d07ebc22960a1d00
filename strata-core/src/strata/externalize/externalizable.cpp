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
#include "strata/externalize/externalizable.hpp"

#include <stdio.h>
#include <tinyxml2.h>

#include <ostream>
#include <sstream>
#include <string>

#include "strata/assorted/assorted_func.hpp"
#include "strata/externalize/tinyxml_wrapper.hpp"

namespace strata {
namespace externalize {

ErrorStack Externalizable::load_from_string(const std::string& xml) {
  tinyxml2::XMLDocument document;
  tinyxml2::XMLError load_error = document.Parse(xml.data(), xml.size());
  if (load_error != tinyxml2::XML_SUCCESS) {
    std::stringstream custom_message;
    custom_message << "xml=" << xml << ", tinyxml2 error=" << load_error;
    return ERROR_STACK_MSG(kErrorCodeConfParseFailed, custom_message.str().c_str());
  } else if (!document.RootElement()) {
    return ERROR_STACK_MSG(kErrorCodeConfEmptyXml, xml.c_str());
  }
  CHECK_ERROR(load(document.RootElement()));
  return kRetOk;
}

void Externalizable::save_to_stream(std::ostream* ptr) const {
  std::ostream &o = *ptr;
  tinyxml2::XMLDocument doc;
  tinyxml2::XMLElement* element = doc.NewElement(get_tag_name());
  if (!element) {
    o << "Out-of-memory during Externalizable::save_to_stream()";
    return;
  }
  doc.InsertFirstChild(element);
  ErrorStack error_stack = save(element);
  if (error_stack.is_error()) {
    o << "Failed during Externalizable::save_to_stream(): " << error_stack;
    return;
  }
  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  o << printer.CStr();
}

ErrorStack Externalizable::load_from_file(const std::string& path) {
  FILE* probe = ::fopen(path.c_str(), "r");
  if (probe == nullptr) {
    return ERROR_STACK_MSG(kErrorCodeConfFileNotFount, path.c_str());
  }
  ::fclose(probe);

  tinyxml2::XMLDocument document;
  tinyxml2::XMLError load_error = document.LoadFile(path.c_str());
  if (load_error != tinyxml2::XML_SUCCESS) {
    std::stringstream custom_message;
    custom_message << "problematic file=" << path << ", tinyxml2 error=" << load_error;
    return ERROR_STACK_MSG(kErrorCodeConfParseFailed, custom_message.str().c_str());
  } else if (!document.RootElement()) {
    return ERROR_STACK_MSG(kErrorCodeConfEmptyXml, path.c_str());
  }
  CHECK_ERROR(load(document.RootElement()));
  return kRetOk;
}

ErrorStack Externalizable::save_to_file(const std::string& path) const {
  tinyxml2::XMLDocument document;
  tinyxml2::XMLElement* root = document.NewElement(get_tag_name());
  CHECK_OUTOFMEMORY(root);
  document.InsertFirstChild(root);
  CHECK_ERROR(save(root));

  // write to a temporary file, then rename it over the destination
  std::string tmp_path = path + ".tmp_save";
  if (document.SaveFile(tmp_path.c_str()) != tinyxml2::XML_SUCCESS) {
    std::stringstream custom_message;
    custom_message << "file=" << tmp_path << ", err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotWrite, custom_message.str().c_str());
  }
  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::stringstream custom_message;
    custom_message << "dest file=" << path << ", src file=" << tmp_path
      << ", err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotRename, custom_message.str().c_str());
  }
  return kRetOk;
}

ErrorStack Externalizable::insert_comment(tinyxml2::XMLElement* element,
                      const std::string& comment) {
  if (comment.empty()) {
    return kRetOk;
  }
  tinyxml2::XMLComment* cm = element->GetDocument()->NewComment(comment.c_str());
  CHECK_OUTOFMEMORY(cm);
  tinyxml2::XMLNode* parent = element->Parent();
  if (!parent) {
    element->GetDocument()->InsertFirstChild(cm);
  } else {
    tinyxml2::XMLNode* previous = element->PreviousSibling();
    if (previous) {
      parent->InsertAfterChild(previous, cm);
    } else {
      parent->InsertFirstChild(cm);
    }
  }
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::add_element(tinyxml2::XMLElement* parent,
                const std::string& tag, const std::string& comment, T value) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  TinyxmlSetter<T> tinyxml_setter;
  tinyxml_setter(element, value);
  parent->InsertEndChild(element);
  if (!comment.empty()) {
    CHECK_ERROR(insert_comment(element,
            tag + " (type=" + assorted::get_pretty_type_name<T>() + "): " + comment));
  }
  return kRetOk;
}

// @cond DOXYGEN_IGNORE
#define EXPLICIT_INSTANTIATION_ADD(x) template ErrorStack Externalizable::add_element< x > \
  (tinyxml2::XMLElement* parent, const std::string& tag, const std::string& comment, x value)
INSTANTIATE_ALL_TYPES(EXPLICIT_INSTANTIATION_ADD);
// @endcond

ErrorStack Externalizable::add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     const std::string& comment, const Externalizable& child) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  parent->InsertEndChild(element);
  CHECK_ERROR(insert_comment(element, comment));
  CHECK_ERROR(child.save(element));
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                      T* out, bool optional, T default_value) {
  TinyxmlGetter<T> tinyxml_getter;
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element) {
    if (tinyxml_getter(element, out) == tinyxml2::XML_SUCCESS) {
      return kRetOk;
    }
    return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, tag.c_str());
  } else if (optional) {
    *out = default_value;
    return kRetOk;
  }
  return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
}

// @cond DOXYGEN_IGNORE
#define EXPLICIT_INSTANTIATION_GET(x) template ErrorStack Externalizable::get_element< x > \
  (tinyxml2::XMLElement* parent, const std::string& tag, x * out, bool optional, x default_value)
INSTANTIATE_ALL_TYPES(EXPLICIT_INSTANTIATION_GET);
// @endcond

ErrorStack Externalizable::get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     Externalizable* child, bool optional) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element) {
    return child->load(element);
  } else if (optional) {
    return kRetOk;
  }
  return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
}

}  // namespace externalize
}  // namespace strata
