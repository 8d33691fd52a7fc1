#pragma once

#include <arbor/vdom/backend.hpp>
#include <arbor/vdom/base_node.hpp>
#include <arbor/vdom/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbor::vdom {

class DomError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Event {
  std::string type;
  NodeId target{};
  NodeId current_target{};
  bool propagation_stopped{false};

  void stop_propagation() { propagation_stopped = true; }
};

enum class DomKind { Element, Text, Fragment };

struct DomNode {
  NodeId id{};
  DomKind kind{DomKind::Element};
  std::string tag;
  std::string text;
  std::map<std::string, std::string> attributes;
  std::string class_name;
  std::map<std::string, std::string> style;
  std::vector<std::pair<std::string, Handler>> listeners;
  DomNode *parent{};
  std::vector<std::unique_ptr<DomNode>> children;
};

// "onClick" -> "click"
inline std::string event_type_for_prop(std::string_view name) {
  std::string out;
  if (name.size() > 2) {
    out.reserve(name.size() - 2);
    for (char c : name.substr(2)) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

// Parses "a: b; c: d" declarations. Malformed declarations are skipped.
inline std::map<std::string, std::string> parse_style(std::string_view css) {
  const auto trim = [](std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
      s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
      s.remove_suffix(1);
    }
    return s;
  };

  std::map<std::string, std::string> out;
  std::size_t pos = 0;
  while (pos <= css.size()) {
    const auto end = css.find(';', pos);
    auto decl = css.substr(pos, end == std::string_view::npos ? std::string_view::npos
                                                              : end - pos);
    pos = end == std::string_view::npos ? css.size() + 1 : end + 1;

    const auto colon = decl.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    const auto name = trim(decl.substr(0, colon));
    const auto value = trim(decl.substr(colon + 1));
    if (name.empty()) {
      continue;
    }
    out.insert_or_assign(std::string{name}, std::string{value});
  }
  return out;
}

// In-memory browser-like document. Nodes created but not yet attached stay
// in a detached pool owned by the document.
class Document {
public:
  Document() {
    root_ = make_node(DomKind::Element);
    root_->tag = "body";
    index_.emplace(root_->id, root_.get());
  }

  Document(const Document &) = delete;
  Document &operator=(const Document &) = delete;

  NodeId mount() const { return root_->id; }

  NodeId create_element(std::string tag) {
    if (tag.empty()) {
      throw DomError{"cannot create an element without a tag"};
    }
    auto n = make_node(DomKind::Element);
    n->tag = std::move(tag);
    return adopt_detached(std::move(n));
  }

  NodeId create_text(std::string value) {
    auto n = make_node(DomKind::Text);
    n->text = std::move(value);
    return adopt_detached(std::move(n));
  }

  NodeId create_fragment() { return adopt_detached(make_node(DomKind::Fragment)); }

  const DomNode *find(NodeId id) const {
    const auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
  }

  DomNode *find(NodeId id) {
    const auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
  }

  bool contains(NodeId id) const { return index_.contains(id); }

  bool attached(NodeId id) const {
    const auto *n = find(id);
    while (n && n->parent) {
      n = n->parent;
    }
    return n == root_.get();
  }

  std::size_t size() const { return index_.size(); }

  std::size_t child_count(NodeId parent) const {
    return require(parent).children.size();
  }

  std::optional<NodeId> child_at(NodeId parent, std::size_t index) const {
    const auto &p = require(parent);
    if (index >= p.children.size()) {
      return std::nullopt;
    }
    return p.children[index]->id;
  }

  std::optional<NodeId> parent_of(NodeId id) const {
    const auto &n = require(id);
    if (!n.parent) {
      return std::nullopt;
    }
    return n.parent->id;
  }

  void append_child(NodeId parent, NodeId child) {
    auto &p = require_container(parent);
    auto owned = take(child, p);
    owned->parent = &p;
    p.children.push_back(std::move(owned));
  }

  void insert_child(NodeId parent, std::size_t index, NodeId child) {
    auto &p = require_container(parent);
    auto owned = take(child, p);
    if (index > p.children.size()) {
      index = p.children.size();
    }
    owned->parent = &p;
    p.children.insert(p.children.begin() + static_cast<std::ptrdiff_t>(index),
                      std::move(owned));
  }

  // Detaches and destroys `child` with its whole subtree.
  void remove_child(NodeId parent, NodeId child) {
    auto &p = require(parent);
    const auto pos = position_of(p, child);
    unindex(*p.children[pos]);
    p.children.erase(p.children.begin() + static_cast<std::ptrdiff_t>(pos));
  }

  // Destroys a node that was created but never attached, with its subtree.
  void destroy_detached(NodeId id) {
    const auto it = detached_.find(id);
    if (it == detached_.end()) {
      throw DomError{"node " + std::to_string(id) + " is not detached"};
    }
    unindex(*it->second);
    detached_.erase(it);
  }

  void replace_child(NodeId parent, NodeId old_child, NodeId new_child) {
    auto &p = require_container(parent);
    if (old_child == new_child) {
      return;
    }
    if (std::none_of(p.children.begin(), p.children.end(),
                     [&](const auto &c) { return c->id == old_child; })) {
      throw DomError{"node " + std::to_string(old_child) + " is not a child of " +
                     std::to_string(parent)};
    }
    auto owned = take(new_child, p);
    const auto pos = position_of(p, old_child);
    unindex(*p.children[pos]);
    owned->parent = &p;
    p.children[pos] = std::move(owned);
  }

  void move_child(NodeId parent, std::size_t from, std::size_t to) {
    auto &p = require(parent);
    const auto n = p.children.size();
    if (from >= n || to >= n) {
      throw DomError{"move index out of range: " + std::to_string(from) +
                     " -> " + std::to_string(to) + " among " +
                     std::to_string(n) + " children"};
    }
    auto &c = p.children;
    if (from < to) {
      std::rotate(c.begin() + static_cast<std::ptrdiff_t>(from),
                  c.begin() + static_cast<std::ptrdiff_t>(from + 1),
                  c.begin() + static_cast<std::ptrdiff_t>(to + 1));
    } else if (from > to) {
      std::rotate(c.begin() + static_cast<std::ptrdiff_t>(to),
                  c.begin() + static_cast<std::ptrdiff_t>(from),
                  c.begin() + static_cast<std::ptrdiff_t>(from + 1));
    }
  }

  void set_text(NodeId id, std::string value) {
    auto &n = require(id);
    if (n.kind != DomKind::Text) {
      throw DomError{"node " + std::to_string(id) + " is not a text node"};
    }
    n.text = std::move(value);
  }

  void set_attribute(NodeId id, const std::string &name, std::string value) {
    require_element(id).attributes.insert_or_assign(name, std::move(value));
  }

  void remove_attribute(NodeId id, const std::string &name) {
    require_element(id).attributes.erase(name);
  }

  std::optional<std::string> attribute(NodeId id, const std::string &name) const {
    const auto &n = require(id);
    const auto it = n.attributes.find(name);
    if (it == n.attributes.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void set_class(NodeId id, std::string value) {
    require_element(id).class_name = std::move(value);
  }

  void set_style(NodeId id, std::map<std::string, std::string> style) {
    require_element(id).style = std::move(style);
  }

  // Registering the same handler twice for one type is a no-op.
  bool add_listener(NodeId id, const std::string &type, Handler h) {
    auto &n = require_element(id);
    for (const auto &l : n.listeners) {
      if (l.first == type && l.second == h) {
        return false;
      }
    }
    n.listeners.emplace_back(type, std::move(h));
    return true;
  }

  bool remove_listener(NodeId id, const std::string &type, const Handler &h) {
    auto &n = require_element(id);
    const auto it = std::find_if(n.listeners.begin(), n.listeners.end(),
                                 [&](const auto &l) {
                                   return l.first == type && l.second == h;
                                 });
    if (it == n.listeners.end()) {
      return false;
    }
    n.listeners.erase(it);
    return true;
  }

  std::size_t listener_count(NodeId id, const std::string &type) const {
    const auto &n = require(id);
    return static_cast<std::size_t>(
        std::count_if(n.listeners.begin(), n.listeners.end(),
                      [&](const auto &l) { return l.first == type; }));
  }

  void focus(NodeId id) {
    require_element(id);
    focused_ = id;
  }

  void blur() { focused_.reset(); }

  std::optional<NodeId> focused() const { return focused_; }

  // Invokes listeners on the target and then on each ancestor until one of
  // them stops propagation. Returns true when at least one listener ran.
  bool dispatch_event(NodeId target, const std::string &type) {
    std::vector<NodeId> chain;
    for (const auto *n = &require(target); n; n = n->parent) {
      chain.push_back(n->id);
    }

    Event ev{type, target, target, false};
    bool handled = false;
    for (const auto id : chain) {
      const auto *n = find(id);
      if (!n) {
        continue;
      }
      std::vector<Handler> hs;
      for (const auto &l : n->listeners) {
        if (l.first == type) {
          hs.push_back(l.second);
        }
      }
      ev.current_target = id;
      for (const auto &h : hs) {
        if (h.fn && *h.fn) {
          (*h.fn)(ev);
          handled = true;
        }
      }
      if (ev.propagation_stopped) {
        break;
      }
    }
    return handled;
  }

private:
  static std::unique_ptr<DomNode> make_node(DomKind kind) {
    auto n = std::make_unique<DomNode>();
    n->id = detail::allocate_id();
    n->kind = kind;
    return n;
  }

  NodeId adopt_detached(std::unique_ptr<DomNode> n) {
    const auto id = n->id;
    index_.emplace(id, n.get());
    detached_.emplace(id, std::move(n));
    return id;
  }

  const DomNode &require(NodeId id) const {
    const auto *n = find(id);
    if (!n) {
      throw DomError{"unknown node " + std::to_string(id)};
    }
    return *n;
  }

  DomNode &require(NodeId id) {
    auto *n = find(id);
    if (!n) {
      throw DomError{"unknown node " + std::to_string(id)};
    }
    return *n;
  }

  DomNode &require_element(NodeId id) {
    auto &n = require(id);
    if (n.kind != DomKind::Element) {
      throw DomError{"node " + std::to_string(id) + " is not an element"};
    }
    return n;
  }

  DomNode &require_container(NodeId id) {
    auto &n = require(id);
    if (n.kind == DomKind::Text) {
      throw DomError{"text node " + std::to_string(id) + " cannot have children"};
    }
    return n;
  }

  static std::size_t position_of(const DomNode &parent, NodeId child) {
    for (std::size_t i = 0; i < parent.children.size(); ++i) {
      if (parent.children[i]->id == child) {
        return i;
      }
    }
    throw DomError{"node " + std::to_string(child) + " is not a child of " +
                   std::to_string(parent.id)};
  }

  // Takes ownership of `id` out of the detached pool or its current parent.
  std::unique_ptr<DomNode> take(NodeId id, const DomNode &new_parent) {
    if (id == root_->id) {
      throw DomError{"the mount node cannot be re-parented"};
    }
    auto &n = require(id);
    for (const auto *a = &new_parent; a; a = a->parent) {
      if (a == &n) {
        throw DomError{"cannot insert node " + std::to_string(id) +
                       " into its own subtree"};
      }
    }

    if (auto it = detached_.find(id); it != detached_.end()) {
      auto owned = std::move(it->second);
      detached_.erase(it);
      return owned;
    }

    auto *old_parent = n.parent;
    if (!old_parent) {
      throw DomError{"node " + std::to_string(id) + " has no owner"};
    }
    const auto pos = position_of(*old_parent, id);
    auto owned = std::move(old_parent->children[pos]);
    old_parent->children.erase(old_parent->children.begin() +
                               static_cast<std::ptrdiff_t>(pos));
    owned->parent = nullptr;
    return owned;
  }

  void unindex(const DomNode &n) {
    if (focused_ && *focused_ == n.id) {
      focused_.reset();
    }
    index_.erase(n.id);
    for (const auto &c : n.children) {
      unindex(*c);
    }
  }

  std::unique_ptr<DomNode> root_;
  std::unordered_map<NodeId, DomNode *> index_;
  std::unordered_map<NodeId, std::unique_ptr<DomNode>> detached_;
  std::optional<NodeId> focused_;
};

inline std::string prop_text(const PropValue &value) {
  if (const auto *s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto *i = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto *d = std::get_if<double>(&value)) {
    return format_number(*d);
  }
  if (const auto *b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  return {};
}

class DomBackend final : public Backend {
public:
  explicit DomBackend(Document &doc) : doc_{doc} {}

  Document &document() { return doc_; }

  std::optional<NodeId> child_at(NodeId parent, std::size_t index) const override {
    return doc_.child_at(parent, index);
  }

  std::size_t child_count(NodeId parent) const override {
    return doc_.child_count(parent);
  }

  NodeId create_node(const CanonicalNode &node) override {
    switch (node.kind) {
    case NodeKind::Text:
      return doc_.create_text(node.text);
    case NodeKind::Forest: {
      const auto id = doc_.create_fragment();
      build_children(id, node.children);
      return id;
    }
    case NodeKind::Element:
      break;
    }

    const auto id = doc_.create_element(node.type);
    try {
      for (const auto &kv : node.props) {
        set_prop(id, kv.first, std::nullopt, kv.second);
      }
    } catch (const std::exception &) {
      doc_.destroy_detached(id);
      throw;
    }
    build_children(id, node.children);
    return id;
  }

  void discard(NodeId node) override { doc_.destroy_detached(node); }

  void append_child(NodeId parent, NodeId child) override {
    doc_.append_child(parent, child);
  }

  void remove_child(NodeId parent, NodeId child) override {
    doc_.remove_child(parent, child);
  }

  void replace_child(NodeId parent, NodeId old_child, NodeId new_child) override {
    doc_.replace_child(parent, old_child, new_child);
  }

  void move_child(NodeId parent, std::size_t from, std::size_t to) override {
    doc_.move_child(parent, from, to);
  }

  void set_prop(NodeId node, const std::string &name,
                const std::optional<PropValue> &old_value,
                const PropValue &value) override {
    if (name == "className" || name == "class") {
      doc_.set_class(node, prop_text(value));
      return;
    }
    if (name == "style") {
      doc_.set_style(node, parse_style(prop_text(value)));
      return;
    }

    if (is_event_prop(name)) {
      const auto type = event_type_for_prop(name);
      if (old_value) {
        if (const auto *old_h = std::get_if<Handler>(&*old_value)) {
          doc_.remove_listener(node, type, *old_h);
        } else {
          doc_.remove_attribute(node, name);
        }
      }
      if (const auto *h = std::get_if<Handler>(&value)) {
        doc_.add_listener(node, type, *h);
        return;
      }
    } else if (std::holds_alternative<Handler>(value)) {
      logger()->debug("handler under non-event prop '{}' ignored", name);
      return;
    }

    if (const auto *b = std::get_if<bool>(&value)) {
      if (*b) {
        doc_.set_attribute(node, name, "");
      } else {
        doc_.remove_attribute(node, name);
      }
      return;
    }
    doc_.set_attribute(node, name, prop_text(value));
  }

  void remove_prop(NodeId node, const std::string &name,
                   const std::optional<PropValue> &old_value) override {
    if (name == "className" || name == "class") {
      doc_.set_class(node, {});
      return;
    }
    if (name == "style") {
      doc_.set_style(node, {});
      return;
    }
    if (is_event_prop(name) && old_value) {
      if (const auto *old_h = std::get_if<Handler>(&*old_value)) {
        doc_.remove_listener(node, event_type_for_prop(name), *old_h);
        return;
      }
    }
    doc_.remove_attribute(node, name);
  }

private:
  // A failed child takes the half-built `parent` down with it.
  void build_children(NodeId parent, const std::vector<CanonicalNode> &children) {
    try {
      for (const auto &c : children) {
        doc_.append_child(parent, create_node(c));
      }
    } catch (const std::exception &) {
      doc_.destroy_detached(parent);
      throw;
    }
  }

  Document &doc_;
};

// Text of all descendant text nodes, in document order.
inline std::string text_content(const Document &doc, NodeId id) {
  const auto *n = doc.find(id);
  if (!n) {
    return {};
  }
  if (n->kind == DomKind::Text) {
    return n->text;
  }
  std::string out;
  for (const auto &c : n->children) {
    out += text_content(doc, c->id);
  }
  return out;
}

// One line per node. Fragments are transparent unless `show_fragments`.
inline void dump_dom(std::ostream &os, const Document &doc, NodeId id,
                     int indent_spaces = 0, bool show_fragments = false) {
  const auto *n = doc.find(id);
  if (!n) {
    return;
  }

  if (n->kind == DomKind::Fragment && !show_fragments) {
    for (const auto &c : n->children) {
      dump_dom(os, doc, c->id, indent_spaces, show_fragments);
    }
    return;
  }

  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  if (n->kind == DomKind::Text) {
    os << "\"" << n->text << "\"\n";
    return;
  }

  if (n->kind == DomKind::Fragment) {
    os << "#fragment";
  } else {
    os << n->tag;
    if (!n->class_name.empty()) {
      os << " class=\"" << n->class_name << "\"";
    }
    for (const auto &kv : n->attributes) {
      os << " " << kv.first << "=\"" << kv.second << "\"";
    }
    if (!n->style.empty()) {
      os << " style=\"";
      bool first = true;
      for (const auto &kv : n->style) {
        if (!std::exchange(first, false)) {
          os << "; ";
        }
        os << kv.first << ": " << kv.second;
      }
      os << "\"";
    }
    std::vector<std::string> types;
    for (const auto &l : n->listeners) {
      types.push_back(l.first);
    }
    std::sort(types.begin(), types.end());
    for (const auto &t : types) {
      os << " @" << t;
    }
  }
  os << "\n";

  for (const auto &c : n->children) {
    dump_dom(os, doc, c->id, indent_spaces + 2, show_fragments);
  }
}

inline std::string dump_dom(const Document &doc, NodeId id) {
  std::ostringstream ss;
  dump_dom(ss, doc, id);
  return ss.str();
}

} // namespace arbor::vdom
