#pragma once

#include <arbor/vdom/base_node.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace arbor::vdom {

// Primitive mutations the patch applier needs from an output tree. Node
// handles are opaque ids owned by the implementation.
struct Backend {
  virtual ~Backend() = default;

  virtual std::optional<NodeId> child_at(NodeId parent,
                                         std::size_t index) const = 0;
  virtual std::size_t child_count(NodeId parent) const = 0;

  // Builds a detached subtree for `node`; Forests become transparent
  // fragments.
  virtual NodeId create_node(const CanonicalNode &node) = 0;
  // Destroys a subtree returned by create_node that was never attached.
  virtual void discard(NodeId node) = 0;

  virtual void append_child(NodeId parent, NodeId child) = 0;
  virtual void remove_child(NodeId parent, NodeId child) = 0;
  virtual void replace_child(NodeId parent, NodeId old_child,
                             NodeId new_child) = 0;
  virtual void move_child(NodeId parent, std::size_t from, std::size_t to) = 0;

  virtual void set_prop(NodeId node, const std::string &name,
                        const std::optional<PropValue> &old_value,
                        const PropValue &value) = 0;
  virtual void remove_prop(NodeId node, const std::string &name,
                           const std::optional<PropValue> &old_value) = 0;
};

} // namespace arbor::vdom
