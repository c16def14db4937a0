//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

#include <FbxDom/Base/NamedType.h>
#include <FbxDom/Dom/ObjectProperties.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/Tree.h>

namespace fbxdom::dom {

class Document;

//! Unique id of an object within a document, as stored in the first attribute
//! of its node.
using ObjectId = NamedType<std::int64_t, struct ObjectIdTag, Comparable,
  Hashable, Printable>;

//! View of one child of the `Objects` section.
/*!
 ```text
 Objects
   Geometry 4242, "Cube\x00\x01Geometry", "Mesh"
     Properties70
       ...
 ```

 The node name is the object class, the second attribute joins the object
 name and class, and the third one is the subclass. Handles are only created
 by the Document, which has already validated the id attribute, and must not
 outlive it.
*/
class ObjectHandle {
public:
  ObjectHandle(const Document& document, tree::NodeHandle node) noexcept
    : document_(&document)
    , node_(node)
  {
  }

  FBXDOM_DOM_NDAPI auto Id() const noexcept -> ObjectId;

  //! Object name, without the `\x00\x01<class>` suffix.
  FBXDOM_DOM_NDAPI auto Name() const noexcept -> std::string_view;

  //! Object class (`Geometry`, `Model`, `Material`...).
  [[nodiscard]] auto Class() const noexcept -> std::string_view
  {
    return node_.Name();
  }

  //! Subclass (`Mesh`, `Null`, ...), empty if the node has none.
  FBXDOM_DOM_NDAPI auto Subclass() const noexcept -> std::string_view;

  //! Own properties of the object, falling back to the template registered
  //! for (Class(), `native_type`).
  FBXDOM_DOM_NDAPI auto Properties(std::string_view native_type) const
    -> ObjectProperties;

  [[nodiscard]] auto Node() const noexcept -> const tree::NodeHandle&
  {
    return node_;
  }

  [[nodiscard]] auto GetDocument() const noexcept -> const Document&
  {
    return *document_;
  }

  friend auto operator==(const ObjectHandle& lhs, const ObjectHandle& rhs)
    -> bool
  {
    return lhs.node_ == rhs.node_;
  }

private:
  const Document* document_;
  tree::NodeHandle node_;
};

} // namespace fbxdom::dom
