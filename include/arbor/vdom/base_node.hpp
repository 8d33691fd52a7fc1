#pragma once

#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::vdom {

using NodeId = std::uint64_t;

struct Event;

using EventCallback = std::function<void(Event &)>;

// Event-handler reference. Two handlers are equal only when they share the
// same callback object.
struct Handler {
  std::shared_ptr<EventCallback> fn;

  explicit operator bool() const noexcept { return fn != nullptr; }

  bool operator==(const Handler &other) const noexcept {
    return fn == other.fn;
  }
};

inline Handler handler(EventCallback fn) {
  return Handler{std::make_shared<EventCallback>(std::move(fn))};
}

using PropValue = std::variant<std::string, std::int64_t, double, bool, Handler>;

using Props = std::map<std::string, PropValue>;

using NodeKey = std::variant<std::int64_t, std::string>;

enum class NodeKind { Element, Text, Forest };

struct CanonicalNode {
  NodeKind kind{NodeKind::Element};
  std::string type;
  std::string text;
  Props props;
  std::vector<CanonicalNode> children;
  std::optional<NodeKey> key;

  bool operator==(const CanonicalNode &) const = default;
};

inline CanonicalNode element(std::string type, Props props = {},
                             std::vector<CanonicalNode> children = {},
                             std::optional<NodeKey> key = std::nullopt) {
  return CanonicalNode{NodeKind::Element, std::move(type), {},
                       std::move(props),  std::move(children), std::move(key)};
}

inline CanonicalNode text(std::string value) {
  CanonicalNode n;
  n.kind = NodeKind::Text;
  n.text = std::move(value);
  return n;
}

inline CanonicalNode forest(std::vector<CanonicalNode> children) {
  CanonicalNode n;
  n.kind = NodeKind::Forest;
  n.children = std::move(children);
  return n;
}

inline std::string format_number(double d) {
  if (std::isnan(d)) {
    return "NaN";
  }
  if (std::isinf(d)) {
    return d > 0 ? "Infinity" : "-Infinity";
  }
  if (d == std::trunc(d) && std::abs(d) < 9.0e15) {
    return std::to_string(static_cast<std::int64_t>(d));
  }
  return fmt::format("{}", d);
}

inline bool same_shape(const CanonicalNode &a, const CanonicalNode &b) {
  if (a.kind != b.kind) {
    return false;
  }
  return a.kind != NodeKind::Element || a.type == b.type;
}

inline bool same_prop_value(const PropValue &a, const PropValue &b) {
  if (const auto *da = std::get_if<double>(&a)) {
    if (const auto *db = std::get_if<double>(&b)) {
      return *da == *db || (std::isnan(*da) && std::isnan(*db));
    }
    return false;
  }
  return a == b;
}

inline bool is_event_prop(const std::string &name) {
  return name.size() > 2 && name[0] == 'o' && name[1] == 'n' &&
         std::isupper(static_cast<unsigned char>(name[2])) != 0;
}

inline const PropValue *find_prop(const Props &props, const std::string &key) {
  const auto it = props.find(key);
  if (it == props.end()) {
    return nullptr;
  }
  return &it->second;
}

inline std::string prop_as_string(const Props &props, const std::string &key,
                                  std::string fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *s = std::get_if<std::string>(pv)) {
    return *s;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return std::to_string(*i);
  }
  return fallback;
}

namespace detail {
inline std::atomic<NodeId> next_node_id{1};

inline NodeId allocate_id() {
  return next_node_id.fetch_add(1, std::memory_order_relaxed);
}
} // namespace detail

inline void dump_key(std::ostream &os, const NodeKey &key) {
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          os << '"' << v << '"';
        } else {
          os << v;
        }
      },
      key);
}

inline void dump_prop_value(std::ostream &os, const PropValue &value) {
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Handler>) {
          os << "<handler>";
        } else if constexpr (std::is_same_v<T, bool>) {
          os << (v ? "true" : "false");
        } else {
          os << v;
        }
      },
      value);
}

inline void dump_tree(std::ostream &os, const CanonicalNode &node,
                      int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  switch (node.kind) {
  case NodeKind::Text:
    os << "\"" << node.text << "\"\n";
    return;
  case NodeKind::Forest:
    os << "<forest>";
    break;
  case NodeKind::Element:
    os << node.type;
    break;
  }

  if (node.key) {
    os << "#";
    dump_key(os, *node.key);
  }

  if (!node.props.empty()) {
    os << " {";
    bool first = true;
    for (const auto &kv : node.props) {
      if (!std::exchange(first, false)) {
        os << ", ";
      }
      os << kv.first << ": ";
      dump_prop_value(os, kv.second);
    }
    os << "}";
  }

  os << "\n";

  for (const auto &child : node.children) {
    dump_tree(os, child, indent_spaces + 2);
  }
}

} // namespace arbor::vdom
