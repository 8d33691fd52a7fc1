#pragma once

#include <arbor/vdom/base_node.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace arbor::vdom {

using NodePath = std::vector<std::size_t>;

struct PatchCreate {
  NodePath path;
  CanonicalNode node;

  bool operator==(const PatchCreate &) const = default;
};

struct PatchRemove {
  NodePath path;

  bool operator==(const PatchRemove &) const = default;
};

// A Forest-valued replacement swaps the child sequence of the node at path.
struct PatchReplace {
  NodePath path;
  CanonicalNode node;

  bool operator==(const PatchReplace &) const = default;
};

struct PatchUpdateProp {
  NodePath path;
  std::string name;
  std::optional<PropValue> old_value;
  std::optional<PropValue> new_value;

  bool operator==(const PatchUpdateProp &) const = default;
};

struct PatchMove {
  NodePath path;
  std::size_t from{};
  std::size_t to{};

  bool operator==(const PatchMove &) const = default;
};

using Patch = std::variant<PatchCreate, PatchRemove, PatchReplace,
                           PatchUpdateProp, PatchMove>;

inline const NodePath &patch_path(const Patch &p) {
  return std::visit([](const auto &op) -> const NodePath & { return op.path; },
                    p);
}

inline const char *patch_name(const Patch &p) {
  return std::visit(
      [](const auto &op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PatchCreate>) {
          return "Create";
        } else if constexpr (std::is_same_v<T, PatchRemove>) {
          return "Remove";
        } else if constexpr (std::is_same_v<T, PatchReplace>) {
          return "Replace";
        } else if constexpr (std::is_same_v<T, PatchUpdateProp>) {
          return "UpdateProp";
        } else {
          return "Move";
        }
      },
      p);
}

inline void dump_path(std::ostream &os, const NodePath &path) {
  os << "[";
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i != 0) {
      os << ",";
    }
    os << path[i];
  }
  os << "]";
}

inline void dump_node_summary(std::ostream &os, const CanonicalNode &node) {
  switch (node.kind) {
  case NodeKind::Text:
    os << "\"" << node.text << "\"";
    break;
  case NodeKind::Forest:
    os << "<forest x" << node.children.size() << ">";
    break;
  case NodeKind::Element:
    os << node.type;
    break;
  }
}

inline void dump_patch(std::ostream &os, const Patch &p) {
  std::visit(
      [&](const auto &op) {
        using T = std::decay_t<decltype(op)>;
        os << patch_name(p) << " ";
        dump_path(os, op.path);
        if constexpr (std::is_same_v<T, PatchCreate> ||
                      std::is_same_v<T, PatchReplace>) {
          os << " -> ";
          dump_node_summary(os, op.node);
        } else if constexpr (std::is_same_v<T, PatchUpdateProp>) {
          os << " " << op.name << ": ";
          if (op.old_value) {
            dump_prop_value(os, *op.old_value);
          } else {
            os << "(absent)";
          }
          os << " => ";
          if (op.new_value) {
            dump_prop_value(os, *op.new_value);
          } else {
            os << "(absent)";
          }
        } else if constexpr (std::is_same_v<T, PatchMove>) {
          os << " @" << op.from << " -> @" << op.to;
        }
      },
      p);
}

inline void dump_patches(std::ostream &os, const std::vector<Patch> &patches) {
  for (const auto &p : patches) {
    dump_patch(os, p);
    os << "\n";
  }
}

inline std::ostream &operator<<(std::ostream &os, const Patch &p) {
  dump_patch(os, p);
  return os;
}

} // namespace arbor::vdom
