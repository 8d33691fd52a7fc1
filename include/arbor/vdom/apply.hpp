#pragma once

#include <arbor/vdom/backend.hpp>
#include <arbor/vdom/log.hpp>
#include <arbor/vdom/patch.hpp>

#include <cstddef>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace arbor::vdom {

class PatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct PatchWarning {
  std::size_t index{};
  std::string message;
};

// Applies patch batches to a Backend. Path [] addresses the first child of
// the mount node. A patch that fails is skipped and recorded; the rest of
// the batch still runs.
class PatchApplier {
public:
  explicit PatchApplier(Backend &backend) : backend_{backend} {}

  NodeId apply(NodeId root, const std::vector<Patch> &patches) {
    warnings_.clear();
    for (std::size_t i = 0; i < patches.size(); ++i) {
      try {
        apply_one(root, patches[i]);
      } catch (const std::exception &e) {
        std::ostringstream where;
        dump_path(where, patch_path(patches[i]));
        logger()->warn("patch #{} {} {} failed: {}", i, patch_name(patches[i]),
                       where.str(), e.what());
        warnings_.push_back(PatchWarning{i, e.what()});
      }
    }
    logger()->debug("applied {} of {} patches", patches.size() - warnings_.size(),
                    patches.size());
    return root;
  }

  const std::vector<PatchWarning> &warnings() const { return warnings_; }

private:
  NodeId resolve(NodeId root, const NodePath &path, std::size_t depth) const {
    auto cur = backend_.child_at(root, 0);
    if (!cur) {
      throw PatchError{"nothing is rendered under the mount node"};
    }
    for (std::size_t i = 0; i < depth; ++i) {
      const auto next = backend_.child_at(*cur, path[i]);
      if (!next) {
        std::ostringstream ss;
        ss << "path ";
        dump_path(ss, path);
        ss << " does not resolve at depth " << i;
        throw PatchError{ss.str()};
      }
      cur = next;
    }
    return *cur;
  }

  NodeId resolve(NodeId root, const NodePath &path) const {
    return resolve(root, path, path.size());
  }

  NodeId resolve_parent(NodeId root, const NodePath &path) const {
    if (path.empty()) {
      return root;
    }
    return resolve(root, path, path.size() - 1);
  }

  // A freshly created subtree that cannot be placed is destroyed, so a failed
  // patch leaves the output unchanged.
  template <typename Attach> void attach_or_discard(NodeId node, Attach &&attach) {
    try {
      attach();
    } catch (const std::exception &) {
      backend_.discard(node);
      throw;
    }
  }

  void apply_one(NodeId root, const Patch &p) {
    std::visit(
        [&](const auto &op) {
          using T = std::decay_t<decltype(op)>;
          if constexpr (std::is_same_v<T, PatchCreate>) {
            const auto parent = resolve_parent(root, op.path);
            const auto index = op.path.empty() ? 0 : op.path.back();
            const auto count = backend_.child_count(parent);
            if (index != count) {
              throw PatchError{"create position " + std::to_string(index) +
                               " is not the end of a list of " +
                               std::to_string(count)};
            }
            const auto node = backend_.create_node(op.node);
            attach_or_discard(node, [&] { backend_.append_child(parent, node); });
          } else if constexpr (std::is_same_v<T, PatchRemove>) {
            const auto parent = resolve_parent(root, op.path);
            backend_.remove_child(parent, resolve(root, op.path));
          } else if constexpr (std::is_same_v<T, PatchReplace>) {
            const auto target = resolve(root, op.path);
            if (op.node.kind == NodeKind::Forest) {
              while (const auto first = backend_.child_at(target, 0)) {
                backend_.remove_child(target, *first);
              }
              for (const auto &c : op.node.children) {
                const auto node = backend_.create_node(c);
                attach_or_discard(node, [&] { backend_.append_child(target, node); });
              }
              return;
            }
            const auto parent = resolve_parent(root, op.path);
            const auto node = backend_.create_node(op.node);
            attach_or_discard(
                node, [&] { backend_.replace_child(parent, target, node); });
          } else if constexpr (std::is_same_v<T, PatchUpdateProp>) {
            const auto target = resolve(root, op.path);
            if (op.new_value) {
              backend_.set_prop(target, op.name, op.old_value, *op.new_value);
            } else {
              backend_.remove_prop(target, op.name, op.old_value);
            }
          } else if constexpr (std::is_same_v<T, PatchMove>) {
            backend_.move_child(resolve_parent(root, op.path), op.from, op.to);
          }
        },
        p);
  }

  Backend &backend_;
  std::vector<PatchWarning> warnings_;
};

} // namespace arbor::vdom
