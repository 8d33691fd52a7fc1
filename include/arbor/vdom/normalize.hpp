#pragma once

#include <arbor/vdom/base_node.hpp>
#include <arbor/vdom/log.hpp>
#include <arbor/vdom/options.hpp>
#include <arbor/vdom/source.hpp>

#include <cmath>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::vdom {

inline constexpr const char *kDepthExceededText = "Maximum depth exceeded";
inline constexpr const char *kErrorClassName = "_error";

// Text form of a primitive description, or nullopt for anything else.
inline std::optional<std::string> stringify_primitive(const Source &src) {
  return std::visit(
      [](const auto &v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return format_number(v);
        } else if constexpr (std::is_same_v<T, bool>) {
          return std::string{v ? "true" : "false"};
        } else {
          return std::nullopt;
        }
      },
      src.v);
}

inline std::optional<PropValue> to_prop_value(const Source &src) {
  return std::visit(
      [](const auto &v) -> std::optional<PropValue> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string> ||
                      std::is_same_v<T, std::int64_t> ||
                      std::is_same_v<T, double> || std::is_same_v<T, bool> ||
                      std::is_same_v<T, Handler>) {
          return PropValue{v};
        } else {
          return std::nullopt;
        }
      },
      src.v);
}

inline std::optional<NodeKey> to_node_key(const Source &src) {
  if (const auto *s = std::get_if<std::string>(&src.v)) {
    return NodeKey{*s};
  }
  if (const auto *i = std::get_if<std::int64_t>(&src.v)) {
    return NodeKey{*i};
  }
  if (const auto *d = std::get_if<double>(&src.v)) {
    if (*d == std::trunc(*d) && std::abs(*d) < 9.0e15) {
      return NodeKey{static_cast<std::int64_t>(*d)};
    }
    return NodeKey{format_number(*d)};
  }
  if (const auto *b = std::get_if<bool>(&src.v)) {
    return NodeKey{std::string{*b ? "true" : "false"}};
  }
  return std::nullopt;
}

inline CanonicalNode depth_exceeded_placeholder() {
  return element("span", {}, {text(kDepthExceededText)});
}

inline CanonicalNode producer_error_placeholder(const std::string &message) {
  return element("span", {{"className", PropValue{std::string{kErrorClassName}}}},
                 {text("Error: " + message)});
}

inline std::optional<CanonicalNode>
normalize(const Source &src, const ReconcileOptions &options = {},
          std::int32_t depth = 0);

namespace detail {

inline void append_flattened(std::vector<CanonicalNode> &out,
                             std::optional<CanonicalNode> node) {
  if (!node) {
    return;
  }
  if (node->kind == NodeKind::Forest) {
    for (auto &c : node->children) {
      out.push_back(std::move(c));
    }
    return;
  }
  out.push_back(std::move(*node));
}

inline std::vector<CanonicalNode> normalize_children(const Source &children,
                                                     const ReconcileOptions &options,
                                                     std::int32_t depth) {
  std::vector<CanonicalNode> out;
  if (const auto *items = children.sequence()) {
    out.reserve(items->size());
    for (const auto &item : *items) {
      append_flattened(out, normalize(item, options, depth + 1));
    }
    return out;
  }
  append_flattened(out, normalize(children, options, depth + 1));
  return out;
}

inline CanonicalNode normalize_element(const std::string &tag, const Source &value,
                                       const ReconcileOptions &options,
                                       std::int32_t depth) {
  auto node = element(tag);

  const auto *entries = value.mapping();
  if (!entries) {
    if (auto s = stringify_primitive(value); s && !s->empty()) {
      node.children.push_back(text(std::move(*s)));
    }
    return node;
  }

  const Source *text_src = nullptr;
  const Source *children_src = nullptr;
  for (const auto &kv : *entries) {
    const auto &name = kv.first;
    const auto &v = kv.second;
    if (name == "text") {
      text_src = &v;
    } else if (name == "children") {
      children_src = &v;
    } else if (name == "key") {
      node.key = to_node_key(v);
    } else if (v.is_null()) {
      continue;
    } else if (auto pv = to_prop_value(v)) {
      node.props.insert_or_assign(name, std::move(*pv));
    } else {
      logger()->debug("<{}> attribute '{}' is not a primitive value, skipped",
                      tag, name);
    }
  }

  if (text_src && !text_src->is_null()) {
    if (auto s = stringify_primitive(*text_src); s && !s->empty()) {
      node.children.push_back(text(std::move(*s)));
    }
  } else if (children_src) {
    node.children = normalize_children(*children_src, options, depth);
  }

  return node;
}

} // namespace detail

inline std::optional<CanonicalNode> normalize(const Source &src,
                                              const ReconcileOptions &options,
                                              std::int32_t depth) {
  if (depth > options.max_depth) {
    logger()->warn("maximum depth {} exceeded while normalizing tree",
                   options.max_depth);
    return depth_exceeded_placeholder();
  }

  if (src.is_null()) {
    return std::nullopt;
  }

  if (auto s = stringify_primitive(src)) {
    if (s->empty()) {
      return std::nullopt;
    }
    return text(std::move(*s));
  }

  if (const auto *items = src.sequence()) {
    std::vector<CanonicalNode> flat;
    flat.reserve(items->size());
    for (const auto &item : *items) {
      detail::append_flattened(flat, normalize(item, options, depth + 1));
    }
    if (flat.empty()) {
      return std::nullopt;
    }
    return forest(std::move(flat));
  }

  if (const auto *fn = std::get_if<SourceProducer>(&src.v)) {
    if (!*fn) {
      return std::nullopt;
    }
    Source produced;
    try {
      produced = (*fn)();
    } catch (const std::exception &e) {
      logger()->error("deferred subtree failed: {}", e.what());
      return producer_error_placeholder(e.what());
    } catch (...) {
      logger()->error("deferred subtree failed with a non-standard exception");
      return producer_error_placeholder("unknown error");
    }
    return normalize(produced, options, depth + 1);
  }

  if (const auto *entries = src.mapping()) {
    if (entries->size() != 1) {
      return std::nullopt;
    }
    const auto &entry = entries->front();
    return detail::normalize_element(entry.first, entry.second, options, depth);
  }

  // A bare handler describes nothing renderable.
  return std::nullopt;
}

} // namespace arbor::vdom
