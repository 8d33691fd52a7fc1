#include <arbor/vdom/reconciler.hpp>
#include <arbor/vdom/render.hpp>

#if !defined(_WIN32) && !defined(__linux__)
int main() { return 0; }
#else

#include <GLFW/glfw3.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#if defined(ARBOR_HAS_FREETYPE) && ARBOR_HAS_FREETYPE
#include <ft2build.h>
#include FT_FREETYPE_H
#endif

using namespace arbor::vdom;

static void gl_set_ortho(int w, int h) {
  glViewport(0, 0, w, h);
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  glOrtho(0.0, static_cast<double>(w), static_cast<double>(h), 0.0, -1.0, 1.0);
  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();
}

static void gl_quad(float x0, float y0, float x1, float y1, bool textured) {
  glBegin(GL_QUADS);
  if (textured) {
    glTexCoord2f(0.0f, 0.0f);
  }
  glVertex2f(x0, y0);
  if (textured) {
    glTexCoord2f(1.0f, 0.0f);
  }
  glVertex2f(x1, y0);
  if (textured) {
    glTexCoord2f(1.0f, 1.0f);
  }
  glVertex2f(x1, y1);
  if (textured) {
    glTexCoord2f(0.0f, 1.0f);
  }
  glVertex2f(x0, y1);
  glEnd();
}

static std::string find_font_path() {
  const char *candidates[] = {
#if defined(_WIN32)
      "C:/Windows/Fonts/segoeui.ttf",
      "C:/Windows/Fonts/arial.ttf",
#else
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
      "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
#endif
  };
  for (const char *p : candidates) {
    if (FILE *f = std::fopen(p, "rb")) {
      std::fclose(f);
      return p;
    }
  }
  return {};
}

// Decodes one UTF-8 sequence; malformed bytes yield U+FFFD.
static std::uint32_t next_codepoint(std::string_view s, std::size_t &i) {
  const auto b0 = static_cast<std::uint8_t>(s[i++]);
  int extra = 0;
  std::uint32_t cp = 0;
  if (b0 < 0x80) {
    return b0;
  } else if ((b0 & 0xE0) == 0xC0) {
    extra = 1;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    extra = 2;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    extra = 3;
    cp = b0 & 0x07;
  } else {
    return 0xFFFD;
  }
  for (int k = 0; k < extra; ++k) {
    if (i >= s.size() || (static_cast<std::uint8_t>(s[i]) & 0xC0) != 0x80) {
      return 0xFFFD;
    }
    cp = (cp << 6) | (static_cast<std::uint8_t>(s[i++]) & 0x3F);
  }
  return cp;
}

struct GlyphTexture {
  GLuint texture{};
  int w{};
  int h{};
  int left{};
  int top{};
  int advance{};
};

// One alpha texture per (codepoint, pixel size).
class GlyphAtlas {
public:
  GlyphAtlas() = default;
  GlyphAtlas(const GlyphAtlas &) = delete;
  GlyphAtlas &operator=(const GlyphAtlas &) = delete;

  ~GlyphAtlas() {
    for (auto &kv : glyphs_) {
      if (kv.second.texture != 0) {
        glDeleteTextures(1, &kv.second.texture);
      }
    }
#if defined(ARBOR_HAS_FREETYPE) && ARBOR_HAS_FREETYPE
    if (face_) {
      FT_Done_Face(face_);
    }
    if (ft_) {
      FT_Done_FreeType(ft_);
    }
#endif
  }

  const GlyphTexture *get(std::uint32_t cp, int px) {
    const auto key = (static_cast<std::uint64_t>(px) << 32) | cp;
    if (const auto it = glyphs_.find(key); it != glyphs_.end()) {
      return &it->second;
    }
    GlyphTexture g{};
    if (!rasterize(cp, px, g)) {
      g = GlyphTexture{};
    }
    return &glyphs_.emplace(key, g).first->second;
  }

private:
  bool rasterize(std::uint32_t cp, int px, GlyphTexture &out) {
#if !(defined(ARBOR_HAS_FREETYPE) && ARBOR_HAS_FREETYPE)
    (void)cp;
    (void)px;
    (void)out;
    return false;
#else
    if (!ensure_face() ||
        FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(px)) != 0) {
      return false;
    }
    const FT_UInt gi = FT_Get_Char_Index(face_, static_cast<FT_ULong>(cp));
    if (FT_Load_Glyph(face_, gi, FT_LOAD_RENDER) != 0) {
      return false;
    }
    const auto &bm = face_->glyph->bitmap;
    out.w = static_cast<int>(bm.width);
    out.h = static_cast<int>(bm.rows);
    out.left = face_->glyph->bitmap_left;
    out.top = face_->glyph->bitmap_top;
    out.advance = static_cast<int>(face_->glyph->advance.x >> 6);
    if (out.w == 0 || out.h == 0) {
      return true;
    }

    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(out.w) *
                                     static_cast<std::size_t>(out.h));
    for (int y = 0; y < out.h; ++y) {
      const auto *row = bm.buffer + static_cast<std::ptrdiff_t>(y) * bm.pitch;
      std::copy(row, row + out.w,
                pixels.begin() + static_cast<std::ptrdiff_t>(y) * out.w);
    }

    glGenTextures(1, &out.texture);
    glBindTexture(GL_TEXTURE_2D, out.texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_ALPHA, out.w, out.h, 0, GL_ALPHA,
                 GL_UNSIGNED_BYTE, pixels.data());
    return true;
#endif
  }

#if defined(ARBOR_HAS_FREETYPE) && ARBOR_HAS_FREETYPE
  bool ensure_face() {
    if (face_) {
      return true;
    }
    if (face_failed_) {
      return false;
    }
    face_failed_ = true;
    if (!ft_ && FT_Init_FreeType(&ft_) != 0) {
      ft_ = nullptr;
      return false;
    }
    const auto path = find_font_path();
    if (path.empty()) {
      logger()->warn("no usable font found, text will not be drawn");
      return false;
    }
    if (FT_New_Face(ft_, path.c_str(), 0, &face_) != 0) {
      logger()->warn("cannot load font {}", path);
      face_ = nullptr;
      return false;
    }
    face_failed_ = false;
    return true;
  }

  FT_Library ft_{};
  FT_Face face_{};
  bool face_failed_{false};
#endif

  std::unordered_map<std::uint64_t, GlyphTexture> glyphs_;
};

struct GLRenderer final : Renderer {
  GlyphAtlas *atlas{};

  void draw_rect(const DrawRect &r) override {
    glDisable(GL_TEXTURE_2D);
    glColor4ub(r.fill.r, r.fill.g, r.fill.b, r.fill.a);
    gl_quad(r.rect.x, r.rect.y, r.rect.x + r.rect.w, r.rect.y + r.rect.h, false);
  }

  void draw_text(const DrawText &t) override {
    if (!atlas) {
      return;
    }
    const auto px = std::max(1, static_cast<int>(std::lround(t.font_px)));
    const float baseline = t.rect.y + (t.rect.h + t.font_px) * 0.5f - 2.0f;
    float pen = t.rect.x;

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glEnable(GL_TEXTURE_2D);
    glTexEnvi(GL_TEXTURE_ENV, GL_TEXTURE_ENV_MODE, GL_MODULATE);
    glColor4ub(t.color.r, t.color.g, t.color.b, t.color.a);

    std::size_t i = 0;
    while (i < t.text.size()) {
      const auto *g = atlas->get(next_codepoint(t.text, i), px);
      if (g->texture != 0) {
        const float x0 = pen + static_cast<float>(g->left);
        const float y0 = baseline - static_cast<float>(g->top);
        glBindTexture(GL_TEXTURE_2D, g->texture);
        gl_quad(x0, y0, x0 + static_cast<float>(g->w),
                y0 + static_cast<float>(g->h), true);
      }
      pen += static_cast<float>(g->advance);
    }
    glDisable(GL_TEXTURE_2D);
  }
};

struct InputCtx {
  Document *doc{};
  LayoutBox *layout{};
  bool dirty{true};
};

static void mouse_button_cb(GLFWwindow *win, int button, int action, int mods) {
  (void)mods;
  if (button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_RELEASE) {
    return;
  }
  auto *ctx = static_cast<InputCtx *>(glfwGetWindowUserPointer(win));
  if (!ctx || !ctx->doc || !ctx->layout) {
    return;
  }

  double xpos = 0.0;
  double ypos = 0.0;
  glfwGetCursorPos(win, &xpos, &ypos);
  int ww = 0;
  int wh = 0;
  glfwGetWindowSize(win, &ww, &wh);
  int fbw = 0;
  int fbh = 0;
  glfwGetFramebufferSize(win, &fbw, &fbh);
  const double sx = ww > 0 ? static_cast<double>(fbw) / ww : 1.0;
  const double sy = wh > 0 ? static_cast<double>(fbh) / wh : 1.0;

  const auto hit = hit_test(*ctx->layout, static_cast<float>(xpos * sx),
                            static_cast<float>(ypos * sy));
  if (hit && ctx->doc->dispatch_event(*hit, "click")) {
    ctx->dirty = true;
  }
}

int main() {
  if (!glfwInit()) {
    return 1;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);

  GLFWwindow *win =
      glfwCreateWindow(800, 600, "arbor_gpu_demo (OpenGL)", nullptr, nullptr);
  if (!win) {
    glfwTerminate();
    return 1;
  }

  glfwMakeContextCurrent(win);
  glfwSwapInterval(1);

  std::int64_t count = 0;
  std::vector<std::string> items{"one", "two", "three", "four"};
  std::mt19937 rng{42};

  auto app = [&]() {
    return node("div")
        .attr("style", "color: #f0f0f0")
        .children({
            node("h1").text("Count: " + std::to_string(count)).build(),
            node("button")
                .key("inc")
                .attr("style", "background: #3060a0")
                .on("onClick", [&](Event &) { ++count; })
                .text("Inc")
                .build(),
            node("button")
                .key("shuffle")
                .on("onClick",
                    [&](Event &) { std::shuffle(items.begin(), items.end(), rng); })
                .text("Shuffle")
                .build(),
            node("ul")
                .children_from([&](auto &list) {
                  for (const auto &item : items) {
                    list.add(node("li").key(item).text(item).build());
                  }
                })
                .build(),
        })
        .build();
  };

  Document doc;
  Reconciler reconciler{doc};
  reconciler.mount(app());

  LayoutBox layout;
  InputCtx input{&doc, &layout, true};
  glfwSetWindowUserPointer(win, &input);
  glfwSetMouseButtonCallback(win, mouse_button_cb);

  {
    GlyphAtlas atlas;
    std::vector<RenderOp> ops;
    int last_fbw = 0;
    int last_fbh = 0;

    while (!glfwWindowShouldClose(win)) {
      glfwPollEvents();

      int fbw = 0;
      int fbh = 0;
      glfwGetFramebufferSize(win, &fbw, &fbh);
      fbw = std::max(1, fbw);
      fbh = std::max(1, fbh);

      if (input.dirty) {
        if (reconciler.update(app()) > 0) {
          logger()->debug("applied {} patches", reconciler.last_patches().size());
        }
      }
      if (input.dirty || fbw != last_fbw || fbh != last_fbh) {
        layout = layout_document(
            doc, SizeF{static_cast<float>(fbw), static_cast<float>(fbh)},
            LayoutMetrics{28.0f, 10.0f, 16.0f, 6.0f});
        ops = build_render_ops(doc, layout);
        last_fbw = fbw;
        last_fbh = fbh;
        input.dirty = false;
      }

      gl_set_ortho(fbw, fbh);
      glDisable(GL_DEPTH_TEST);
      glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
      glClear(GL_COLOR_BUFFER_BIT);

      GLRenderer renderer;
      renderer.atlas = &atlas;
      render_with(renderer, ops);

      glfwSwapBuffers(win);
    }
  }

  glfwDestroyWindow(win);
  glfwTerminate();
  return 0;
}

#endif
