#pragma once

#include <arbor/vdom/base_node.hpp>
#include <arbor/vdom/options.hpp>
#include <arbor/vdom/patch.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace arbor::vdom {

// Unkeyed children are always matched by index, even next to keyed
// siblings.
enum class MatchMode { Unkeyed, Keyed };

inline MatchMode match_mode(const CanonicalNode &a, const CanonicalNode &b) {
  return a.key && b.key ? MatchMode::Keyed : MatchMode::Unkeyed;
}

inline void diff_nodes(const CanonicalNode *old_node,
                       const CanonicalNode *new_node, NodePath &path,
                       std::vector<Patch> &out,
                       const ReconcileOptions &options);

inline void diff_props(const Props &old_props, const Props &new_props,
                       const NodePath &path, std::vector<Patch> &out) {
  auto o = old_props.begin();
  auto n = new_props.begin();
  while (o != old_props.end() || n != new_props.end()) {
    if (n == new_props.end() || (o != old_props.end() && o->first < n->first)) {
      out.push_back(PatchUpdateProp{path, o->first, o->second, std::nullopt});
      ++o;
    } else if (o == old_props.end() || n->first < o->first) {
      out.push_back(PatchUpdateProp{path, n->first, std::nullopt, n->second});
      ++n;
    } else {
      if (!same_prop_value(o->second, n->second)) {
        out.push_back(PatchUpdateProp{path, o->first, o->second, n->second});
      }
      ++o;
      ++n;
    }
  }
}

namespace detail {

inline std::size_t find_live_key(const std::vector<const CanonicalNode *> &live,
                                 std::size_t from, const NodeKey &key) {
  for (std::size_t j = from; j < live.size(); ++j) {
    if (live[j]->key && *live[j]->key == key) {
      return j;
    }
  }
  return live.size();
}

inline bool exceeds_bailout(std::size_t old_size, std::size_t new_size,
                            double ratio) {
  const auto longest = std::max(old_size, new_size);
  const auto delta =
      old_size > new_size ? old_size - new_size : new_size - old_size;
  return static_cast<double>(delta) > ratio * static_cast<double>(longest);
}

} // namespace detail

// Reconciles two sibling lists living under `path`. `live` mirrors the order
// the output will have once the patches emitted so far are applied, so every
// emitted path and index is valid at the moment its patch runs.
inline void diff_children(const std::vector<CanonicalNode> &old_children,
                          const std::vector<CanonicalNode> &new_children,
                          NodePath &path, std::vector<Patch> &out,
                          const ReconcileOptions &options) {
  if (detail::exceeds_bailout(old_children.size(), new_children.size(),
                              options.bailout_ratio)) {
    out.push_back(PatchReplace{path, forest(new_children)});
    return;
  }

  std::map<NodeKey, std::size_t> new_keys;
  for (std::size_t i = 0; i < new_children.size(); ++i) {
    if (new_children[i].key) {
      new_keys.emplace(*new_children[i].key, i);
    }
  }

  std::vector<const CanonicalNode *> live;
  live.reserve(old_children.size());
  for (const auto &c : old_children) {
    live.push_back(&c);
  }

  for (std::size_t i = 0; i < new_children.size(); ++i) {
    const auto &next = new_children[i];

    if (i >= live.size()) {
      path.push_back(i);
      out.push_back(PatchCreate{path, next});
      path.pop_back();
      live.push_back(&next);
      continue;
    }

    const auto *current = live[i];
    if (match_mode(*current, next) == MatchMode::Unkeyed ||
        *current->key == *next.key) {
      path.push_back(i);
      diff_nodes(current, &next, path, out, options);
      path.pop_back();
      continue;
    }

    if (!new_keys.contains(*current->key)) {
      path.push_back(i);
      out.push_back(PatchReplace{path, next});
      path.pop_back();
      live[i] = &next;
      continue;
    }

    auto from = detail::find_live_key(live, i + 1, *next.key);
    const bool fresh = from == live.size();
    if (fresh) {
      path.push_back(live.size());
      out.push_back(PatchCreate{path, next});
      path.pop_back();
      live.push_back(&next);
    }

    path.push_back(i);
    out.push_back(PatchMove{path, from, i});
    const auto *moved = live[from];
    live.erase(live.begin() + static_cast<std::ptrdiff_t>(from));
    live.insert(live.begin() + static_cast<std::ptrdiff_t>(i), moved);
    if (!fresh && options.rediff_moves) {
      diff_nodes(moved, &next, path, out, options);
    }
    path.pop_back();
  }

  const auto new_size = new_children.size();
  for (std::size_t i = new_size; i < live.size(); ++i) {
    path.push_back(new_size);
    out.push_back(PatchRemove{path});
    path.pop_back();
  }
}

inline void diff_nodes(const CanonicalNode *old_node,
                       const CanonicalNode *new_node, NodePath &path,
                       std::vector<Patch> &out,
                       const ReconcileOptions &options) {
  if (!old_node && !new_node) {
    return;
  }
  if (!old_node) {
    out.push_back(PatchCreate{path, *new_node});
    return;
  }
  if (!new_node) {
    out.push_back(PatchRemove{path});
    return;
  }

  const bool old_forest = old_node->kind == NodeKind::Forest;
  const bool new_forest = new_node->kind == NodeKind::Forest;
  if (old_forest != new_forest) {
    out.push_back(PatchRemove{path});
    out.push_back(PatchCreate{path, *new_node});
    return;
  }

  if (old_node->kind == NodeKind::Text || new_node->kind == NodeKind::Text) {
    if (old_node->kind != new_node->kind || old_node->text != new_node->text) {
      out.push_back(PatchReplace{path, *new_node});
    }
    return;
  }

  if (old_forest) {
    diff_children(old_node->children, new_node->children, path, out, options);
    return;
  }

  if (old_node->type != new_node->type) {
    out.push_back(PatchReplace{path, *new_node});
    return;
  }

  diff_props(old_node->props, new_node->props, path, out);
  diff_children(old_node->children, new_node->children, path, out, options);
}

inline std::vector<Patch> diff(const CanonicalNode *old_node,
                               const CanonicalNode *new_node,
                               NodePath path = {},
                               const ReconcileOptions &options = {}) {
  std::vector<Patch> out;
  diff_nodes(old_node, new_node, path, out, options);
  return out;
}

inline std::vector<Patch> diff(const std::optional<CanonicalNode> &old_node,
                               const std::optional<CanonicalNode> &new_node,
                               NodePath path = {},
                               const ReconcileOptions &options = {}) {
  return diff(old_node ? &*old_node : nullptr,
              new_node ? &*new_node : nullptr, std::move(path), options);
}

inline std::vector<Patch> diff(const CanonicalNode &old_node,
                               const CanonicalNode &new_node,
                               NodePath path = {},
                               const ReconcileOptions &options = {}) {
  return diff(&old_node, &new_node, std::move(path), options);
}

} // namespace arbor::vdom
