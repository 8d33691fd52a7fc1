#pragma once

#include <arbor/vdom/dom.hpp>
#include <arbor/vdom/normalize.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::vdom {

struct SizeF {
  float w{};
  float h{};
};

struct RectF {
  float x{};
  float y{};
  float w{};
  float h{};

  bool contains(float px, float py) const {
    return px >= x && py >= y && px < x + w && py < y + h;
  }
};

struct ColorU8 {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  std::uint8_t a{255};
};

struct LayoutMetrics {
  float line_height{20.0f};
  float char_width{8.0f};
  float indent{12.0f};
  float box_padding{4.0f};
};

// Block flow over the live document: every element spans its parent's
// width, children stack vertically, text takes one line.
struct LayoutBox {
  NodeId id{};
  DomKind kind{DomKind::Element};
  std::string tag;
  RectF frame;
  std::vector<LayoutBox> children;
};

inline int hex_nibble(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  return -1;
}

inline bool parse_hex_byte(std::string_view s, std::size_t i, std::uint8_t &out) {
  if (i + 1 >= s.size()) {
    return false;
  }
  const int hi = hex_nibble(s[i]);
  const int lo = hex_nibble(s[i + 1]);
  if (hi < 0 || lo < 0) {
    return false;
  }
  out = static_cast<std::uint8_t>((hi << 4) | lo);
  return true;
}

inline std::optional<ColorU8> parse_color(std::string_view s) {
  std::uint8_t r{}, g{}, b{}, a{255};
  if (s.size() == 7 && s[0] == '#') {
    if (!parse_hex_byte(s, 1, r) || !parse_hex_byte(s, 3, g) ||
        !parse_hex_byte(s, 5, b)) {
      return std::nullopt;
    }
    return ColorU8{r, g, b, a};
  }
  if (s.size() == 9 && s[0] == '#') {
    if (!parse_hex_byte(s, 1, r) || !parse_hex_byte(s, 3, g) ||
        !parse_hex_byte(s, 5, b) || !parse_hex_byte(s, 7, a)) {
      return std::nullopt;
    }
    return ColorU8{r, g, b, a};
  }
  return std::nullopt;
}

inline bool is_boxed(const DomNode &n) {
  return n.kind == DomKind::Element &&
         (n.tag == "button" || n.class_name == kErrorClassName ||
          n.style.contains("background"));
}

namespace detail {

// Lays out `n` at (x, y) and returns the height it takes. Fragments add
// their children straight to `out`.
inline float layout_into(const DomNode &n, float x, float y, float w,
                         const LayoutMetrics &m, std::vector<LayoutBox> &out) {
  if (n.kind == DomKind::Text) {
    const auto text_w =
        std::min(w, static_cast<float>(n.text.size()) * m.char_width);
    out.push_back(LayoutBox{n.id, n.kind, {}, RectF{x, y, text_w, m.line_height}, {}});
    return m.line_height;
  }

  if (n.kind == DomKind::Fragment) {
    float h = 0.0f;
    for (const auto &c : n.children) {
      h += layout_into(*c, x, y + h, w, m, out);
    }
    return h;
  }

  LayoutBox box{n.id, n.kind, n.tag, RectF{x, y, w, 0.0f}, {}};
  const auto pad = is_boxed(n) ? m.box_padding : 0.0f;
  const auto inner_x = x + m.indent;
  const auto inner_w = std::max(0.0f, w - m.indent - pad);
  float h = pad;
  for (const auto &c : n.children) {
    h += layout_into(*c, inner_x, y + h, inner_w, m, box.children);
  }
  h += pad;
  if (is_boxed(n)) {
    h = std::max(h, m.line_height);
  }
  box.frame.h = h;
  out.push_back(std::move(box));
  return h;
}

} // namespace detail

inline LayoutBox layout_document(const Document &doc, SizeF viewport,
                                 const LayoutMetrics &m = {}) {
  LayoutBox root{doc.mount(), DomKind::Element, "body",
                 RectF{0.0f, 0.0f, viewport.w, viewport.h}, {}};
  const auto *body = doc.find(doc.mount());
  float y = 0.0f;
  for (const auto &c : body->children) {
    y += detail::layout_into(*c, 0.0f, y, viewport.w, m, root.children);
  }
  return root;
}

// Deepest box under the point, text boxes included.
inline std::optional<NodeId> hit_test(const LayoutBox &box, float x, float y) {
  if (!box.frame.contains(x, y)) {
    return std::nullopt;
  }
  for (auto it = box.children.rbegin(); it != box.children.rend(); ++it) {
    if (auto hit = hit_test(*it, x, y)) {
      return hit;
    }
  }
  return box.id;
}

inline void dump_layout(std::ostream &os, const LayoutBox &box,
                        int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }
  os << (box.kind == DomKind::Text ? std::string{"#text"} : box.tag) << "#"
     << box.id << " [" << box.frame.x << "," << box.frame.y << " "
     << box.frame.w << "x" << box.frame.h << "]\n";
  for (const auto &c : box.children) {
    dump_layout(os, c, indent_spaces + 2);
  }
}

struct DrawRect {
  RectF rect;
  ColorU8 fill;
};

struct DrawText {
  RectF rect;
  std::string text;
  ColorU8 color;
  float font_px{16.0f};
};

using RenderOp = std::variant<DrawRect, DrawText>;

struct Renderer {
  virtual ~Renderer() = default;
  virtual void draw_rect(const DrawRect &r) = 0;
  virtual void draw_text(const DrawText &t) = 0;
};

inline void render_with(Renderer &renderer, const std::vector<RenderOp> &ops) {
  for (const auto &op : ops) {
    std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, DrawRect>) {
            renderer.draw_rect(v);
          } else if constexpr (std::is_same_v<T, DrawText>) {
            renderer.draw_text(v);
          }
        },
        op);
  }
}

inline ColorU8 box_fill(const DomNode &n) {
  if (const auto it = n.style.find("background"); it != n.style.end()) {
    if (auto c = parse_color(it->second)) {
      return *c;
    }
  }
  if (n.class_name == kErrorClassName) {
    return ColorU8{160, 40, 40, 255};
  }
  return ColorU8{80, 80, 80, 255};
}

inline ColorU8 text_color(const DomNode *parent) {
  if (parent) {
    if (const auto it = parent->style.find("color"); it != parent->style.end()) {
      if (auto c = parse_color(it->second)) {
        return *c;
      }
    }
  }
  return ColorU8{255, 255, 255, 255};
}

inline void build_render_ops(const Document &doc, const LayoutBox &box,
                             std::vector<RenderOp> &out) {
  const auto *n = doc.find(box.id);
  if (!n) {
    return;
  }
  if (n->kind == DomKind::Text) {
    out.push_back(DrawText{box.frame, n->text, text_color(n->parent)});
    return;
  }
  if (is_boxed(*n)) {
    out.push_back(DrawRect{box.frame, box_fill(*n)});
  }
  for (const auto &c : box.children) {
    build_render_ops(doc, c, out);
  }
}

inline std::vector<RenderOp> build_render_ops(const Document &doc,
                                              const LayoutBox &layout_root) {
  std::vector<RenderOp> out;
  build_render_ops(doc, layout_root, out);
  return out;
}

inline void dump_render_ops(std::ostream &os,
                            const std::vector<RenderOp> &ops) {
  for (const auto &op : ops) {
    std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, DrawRect>) {
            os << "Rect [" << v.rect.x << "," << v.rect.y << " " << v.rect.w
               << "x" << v.rect.h << "]\n";
          } else if constexpr (std::is_same_v<T, DrawText>) {
            os << "Text [" << v.rect.x << "," << v.rect.y << " " << v.rect.w
               << "x" << v.rect.h << "] '" << v.text << "'\n";
          }
        },
        op);
  }
}

struct AsciiSurface {
  int cols{};
  int rows{};
  std::vector<char> cells;

  AsciiSurface(int c, int r)
      : cols{c}, rows{r},
        cells(static_cast<std::size_t>(c) * static_cast<std::size_t>(r), ' ') {}

  void set(int x, int y, char ch) {
    if (x < 0 || y < 0 || x >= cols || y >= rows) {
      return;
    }
    cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(cols) +
          static_cast<std::size_t>(x)] = ch;
  }

  char get(int x, int y) const {
    if (x < 0 || y < 0 || x >= cols || y >= rows) {
      return ' ';
    }
    return cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(cols) +
                 static_cast<std::size_t>(x)];
  }
};

class AsciiRenderer final : public Renderer {
public:
  AsciiRenderer(AsciiSurface &surface, float sx, float sy)
      : surface_{surface}, sx_{sx}, sy_{sy} {}

  void draw_rect(const DrawRect &r) override {
    const auto x0 = static_cast<int>(std::floor(r.rect.x * sx_));
    const auto y0 = static_cast<int>(std::floor(r.rect.y * sy_));
    const auto x1 = static_cast<int>(std::ceil((r.rect.x + r.rect.w) * sx_));
    const auto y1 = static_cast<int>(std::ceil((r.rect.y + r.rect.h) * sy_));
    for (int y = y0; y < y1; ++y) {
      for (int x = x0; x < x1; ++x) {
        surface_.set(x, y, '#');
      }
    }
  }

  void draw_text(const DrawText &t) override {
    const auto x0 = static_cast<int>(std::floor(t.rect.x * sx_));
    const auto y0 = static_cast<int>(std::floor(t.rect.y * sy_));
    int x = x0;
    for (char ch : t.text) {
      if (x >= surface_.cols) {
        break;
      }
      surface_.set(x, y0, ch);
      ++x;
    }
  }

private:
  AsciiSurface &surface_;
  float sx_{1.0f};
  float sy_{1.0f};
};

inline void render_ascii(std::ostream &os, const std::vector<RenderOp> &ops,
                         SizeF viewport_px, int cols = 80, int rows = 24) {
  if (cols <= 0 || rows <= 0) {
    return;
  }

  AsciiSurface surf{cols, rows};
  const float sx =
      viewport_px.w > 0 ? static_cast<float>(cols) / viewport_px.w : 1.0f;
  const float sy =
      viewport_px.h > 0 ? static_cast<float>(rows) / viewport_px.h : 1.0f;
  AsciiRenderer renderer{surf, sx, sy};
  render_with(renderer, ops);

  for (int y = 0; y < rows; ++y) {
    for (int x = 0; x < cols; ++x) {
      os.put(surf.get(x, y));
    }
    os.put('\n');
  }
}

} // namespace arbor::vdom
