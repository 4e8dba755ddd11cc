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
#ifndef MEMENTO_EXTERNALIZE_EXTERNALIZABLE_HPP_
#define MEMENTO_EXTERNALIZE_EXTERNALIZABLE_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "memento/error_stack.hpp"
#include "memento/assorted/assorted_func.hpp"
#include "memento/fs/fwd.hpp"

// forward declarations for tinyxml2. They should provide a header file for this...
namespace tinyxml2 {
  class XMLDocument;
  class XMLElement;
  class XMLAttribute;
  class XMLComment;
  class XMLNode;
  class XMLText;
  class XMLDeclaration;
  class XMLUnknown;
  class XMLPrinter;
}  // namespace tinyxml2

namespace memento {
namespace externalize {
/**
 * @brief Represents an object that can be written to and read from files/bytes in XML format.
 * @ingroup EXTERNALIZE
 * @details
 * Derived classes must implement load() and save().
 */
struct Externalizable {
  virtual ~Externalizable() {}

  /**
   * @brief Reads the content of this object from the given XML element.
   * @param[in] element the XML element that represents this object
   * @details
   * Expect errors due to missing-elements, out-of-range values, etc.
   */
  virtual ErrorStack load(tinyxml2::XMLElement* element) = 0;

  /**
   * @brief Writes the content of this object to the given XML element.
   * @param[in] element the XML element that represents this object
   * @details
   * Expect only out-of-memory error.
   * The parent object determines children's tag names because one parent object might have
   * multiple child objects of the same type with different XML element name.
   */
  virtual ErrorStack save(tinyxml2::XMLElement* element) const = 0;

  /**
   * @brief Returns an XML tag name for this object as a root element.
   */
  virtual const char* get_tag_name() const = 0;

  /**
   * @brief Polymorphic assign operator. This should invoke operator= of the derived class.
   * @param[in] other assigned value. It must be dynamic-castable to the assignee class.
   */
  virtual void assign(const memento::externalize::Externalizable *other) = 0;

  /**
   * @brief Invokes save() and directs the resulting XML text to the given stream.
   */
  void        save_to_stream(std::ostream* ptr) const;

  /**
   * @brief Invokes save() and returns the resulting XML text.
   * @details
   * The value codec uses this to store Externalizable return values.
   */
  ErrorStack  save_to_string(std::string* out) const;

  /**
   * @brief Load the content of this object from the given XML string.
   */
  ErrorStack  load_from_string(const std::string& xml);

  /**
   * @brief Load the content of this object from the specified XML file.
   * @param[in] path path of the XML file.
   */
  ErrorStack  load_from_file(const fs::Path &path);

  /**
   * @brief Atomically and durably writes out this object to the specified XML file.
   * @param[in] path path of the XML file.
   * @details
   * If the file exists, this method atomically overwrites it via POSIX's atomic rename semantics.
   * If the parent folder doesn't exist, this method automatically creates the folder.
   */
  ErrorStack  save_to_file(const fs::Path &path) const;

  // convenience methods
  static ErrorStack insert_comment(tinyxml2::XMLElement* element, const std::string& comment);
  static ErrorStack append_comment(tinyxml2::XMLElement* parent, const std::string& comment);
  static ErrorStack create_element(tinyxml2::XMLElement* parent, const std::string& name,
                  tinyxml2::XMLElement** out);

  /**
   * Only declaration in header. Explicitly instantiated in cpp for each type this func handles.
   */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, T value);

  /** vector version */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
            const std::string& comment, const std::vector< T >& value) {
    if (comment.size() > 0) {
      CHECK_ERROR(append_comment(parent,
        tag + " (type=" + assorted::get_pretty_type_name< std::vector< T > >()
          + "): " + comment));
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
      CHECK_ERROR(add_element(parent, tag, "", value[i]));
    }
    return kRetOk;
  }

  /** enum version */
  template <typename ENUM>
  static ErrorStack add_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, ENUM value) {
    return add_element(parent, tag, comment, static_cast<int64_t>(value));
  }

  /** child Externalizable version */
  static ErrorStack add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, const Externalizable& child);

  /**
   * Only declaration in header. Explicitly instantiated in cpp for each type this func handles.
   */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional = false, T value = T());
  /** string type is bit special. */
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional = false, const char* value = "");

  /** enum version */
  template <typename ENUM>
  static ErrorStack get_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
          ENUM* out, bool optional = false, ENUM default_value = static_cast<ENUM>(0)) {
    // enum might be signged or unsigned, 1 byte, 2 byte, or 4 byte.
    // But surely it won't exceed int64_t range.
    int64_t tmp;
    CHECK_ERROR(get_element<int64_t>(parent, tag, &tmp, optional, default_value));
    if (static_cast<int64_t>(static_cast<ENUM>(tmp)) != tmp) {
      return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
    }
    *out = static_cast<ENUM>(tmp);
    return kRetOk;
  }

  /**
   * vector version.
   * Only declaration in header. Explicitly instantiated in cpp for each type this func handles.
   */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
            std::vector< T >* out, bool optional = false);

  /** child Externalizable version */
  static ErrorStack get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
            Externalizable* child, bool optional = false);
};

}  // namespace externalize
}  // namespace memento

// A bit tricky to get "a" from a in C macro.
#define EX_QUOTE(str) #str
#define EX_EXPAND(str) EX_QUOTE(str)

/**
 * @def EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @brief Adds an xml element to represent a member variable of \e this object.
 * @param[in] element the current XML element that represents \e this
 * @param[in] attribute the member variable of \e this to save. This is also used as tag name.
 * @param[in] comment this is output as an XML comment.
 */
#define EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_element(element, EX_EXPAND(attribute), comment, attribute))
/**
 * @def EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @copydoc EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment)
 */
#define EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_enum_element(element, EX_EXPAND(attribute), comment, attribute))

/**
 * @def EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @brief Reads a child xml element to load a member variable of \e this object.
 */
#define EXTERNALIZE_LOAD_ELEMENT(element, attribute) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute))
/**
 * @def EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value)
 * @ingroup EXTERNALIZE
 * @copydoc EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 * @param[in] default_value If the element doesn't exist, this value is set to the variable.
 */
#define EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute, true, default_value))

/**
 * @def EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @copydoc EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 */
#define EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute) \
  CHECK_ERROR(get_enum_element(element, EX_EXPAND(attribute), & attribute))

/**
 * @def EXTERNALIZABLE(clazz)
 * @ingroup EXTERNALIZE
 * @brief Macro to declare/define essential methods for an externalizable class.
 * @details
 * Each externalizable class should invoke this macro in public scope of class definition.
 * Then, it should define load() and save() in cpp.
 */
#define EXTERNALIZABLE(clazz) \
  ErrorStack load(tinyxml2::XMLElement* element) override;\
  ErrorStack save(tinyxml2::XMLElement* element) const override;\
  const char* get_tag_name() const override { return EX_EXPAND(clazz); }\
  void assign(const memento::externalize::Externalizable *other) override {\
    *this = *dynamic_cast< const clazz * >(other);\
  }\
  friend std::ostream& operator<<(std::ostream& o, const clazz & v) {\
    v.save_to_stream(&o);\
    return o;\
  }

#endif  // MEMENTO_EXTERNALIZE_EXTERNALIZABLE_HPP_
