#pragma once

#include <arbor/vdom/base_node.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::vdom {

struct Source;

using SourceProducer = std::function<Source()>;

// Author-facing tree description: null, primitives, handler references,
// ordered sequences, ordered mappings and deferred producers.
struct Source {
  using Sequence = std::vector<Source>;
  using Entry = std::pair<std::string, Source>;
  using Mapping = std::vector<Entry>;

  std::variant<std::monostate, std::string, std::int64_t, double, bool,
               Handler, Sequence, Mapping, SourceProducer>
      v;

  Source() = default;
  Source(std::nullptr_t) {}
  Source(std::string s) : v{std::move(s)} {}
  Source(const char *s) : v{std::string{s}} {}
  Source(std::int64_t i) : v{i} {}
  Source(double d) : v{d} {}
  Source(bool b) : v{b} {}
  Source(Handler h) : v{std::move(h)} {}
  Source(Sequence s) : v{std::move(s)} {}
  Source(Mapping m) : v{std::move(m)} {}
  Source(SourceProducer fn) : v{std::move(fn)} {}

  template <typename Int,
            typename = std::enable_if_t<
                std::is_integral_v<std::remove_reference_t<Int>> &&
                !std::is_same_v<std::remove_reference_t<Int>, bool> &&
                !std::is_same_v<std::remove_reference_t<Int>, std::int64_t>>>
  Source(Int i) : v{static_cast<std::int64_t>(i)} {}

  bool is_null() const noexcept {
    return std::holds_alternative<std::monostate>(v);
  }

  const Mapping *mapping() const { return std::get_if<Mapping>(&v); }

  const Sequence *sequence() const { return std::get_if<Sequence>(&v); }

  const Source *find(std::string_view key) const {
    const auto *m = mapping();
    if (!m) {
      return nullptr;
    }
    for (const auto &kv : *m) {
      if (kv.first == key) {
        return &kv.second;
      }
    }
    return nullptr;
  }
};

inline Source seq(std::initializer_list<Source> items) {
  return Source{Source::Sequence(items.begin(), items.end())};
}

inline Source attrs(std::initializer_list<Source::Entry> entries) {
  return Source{Source::Mapping(entries.begin(), entries.end())};
}

// {tag: {entries...}}
inline Source el(std::string tag, std::initializer_list<Source::Entry> entries) {
  Source::Mapping m;
  m.emplace_back(std::move(tag), attrs(entries));
  return Source{std::move(m)};
}

// {tag: value}
inline Source leaf(std::string tag, Source value) {
  Source::Mapping m;
  m.emplace_back(std::move(tag), std::move(value));
  return Source{std::move(m)};
}

inline Source lazy(SourceProducer fn) { return Source{std::move(fn)}; }

class SourceBuilder {
public:
  explicit SourceBuilder(std::string tag) : tag_{std::move(tag)} {}

  SourceBuilder &key(std::string k) { return set("key", Source{std::move(k)}); }

  SourceBuilder &key(std::int64_t k) { return set("key", Source{k}); }

  SourceBuilder &attr(std::string name, Source value) {
    return set(std::move(name), std::move(value));
  }

  SourceBuilder &on(std::string event_prop, EventCallback fn) {
    return set(std::move(event_prop), Source{handler(std::move(fn))});
  }

  SourceBuilder &text(Source value) { return set("text", std::move(value)); }

  SourceBuilder &children(std::initializer_list<Source> nodes) {
    return set("children", seq(nodes));
  }

  SourceBuilder &children(Source::Sequence nodes) {
    return set("children", Source{std::move(nodes)});
  }

  template <typename F> SourceBuilder &children_from(F &&fn) {
    ChildCollector collector;
    fn(collector);
    return children(std::move(collector.children));
  }

  Source build() const & { return leaf(tag_, Source{entries_}); }

  Source build() && {
    return leaf(std::move(tag_), Source{std::move(entries_)});
  }

private:
  struct ChildCollector {
    Source::Sequence children;

    void add(Source node) { children.push_back(std::move(node)); }
  };

  SourceBuilder &set(std::string name, Source value) {
    for (auto &kv : entries_) {
      if (kv.first == name) {
        kv.second = std::move(value);
        return *this;
      }
    }
    entries_.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  std::string tag_;
  Source::Mapping entries_;
};

inline SourceBuilder node(std::string tag) { return SourceBuilder{std::move(tag)}; }

struct SourceParseError {
  std::int32_t line{};
  std::int32_t column{};
  std::string message;
};

struct ParseSourceResult {
  Source source;
  std::vector<SourceParseError> errors;

  bool ok() const noexcept { return errors.empty(); }
};

namespace detail {

struct SourceJsonParser {
  std::string_view s;
  std::size_t i{};
  std::int32_t line{1};
  std::int32_t col{1};
  std::vector<SourceParseError> *errors{};

  void add_error(std::string msg) {
    if (errors) {
      errors->push_back(SourceParseError{line, col, std::move(msg)});
    }
  }

  bool eof() const { return i >= s.size(); }

  char peek() const { return eof() ? '\0' : s[i]; }

  char get() {
    if (eof()) {
      return '\0';
    }
    const char c = s[i++];
    if (c == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
    return c;
  }

  void skip_ws() {
    for (;;) {
      const char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        get();
        continue;
      }
      break;
    }
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) {
      return false;
    }
    get();
    return true;
  }

  bool consume_word(std::string_view w) {
    if (s.substr(i, w.size()) != w) {
      return false;
    }
    i += w.size();
    col += static_cast<std::int32_t>(w.size());
    return true;
  }

  std::optional<std::string> parse_string() {
    skip_ws();
    if (peek() != '"') {
      add_error("expected string");
      return std::nullopt;
    }
    get();
    std::string out;
    while (!eof()) {
      const char c = get();
      if (c == '"') {
        return out;
      }
      if (c == '\\') {
        if (eof()) {
          break;
        }
        const char e = get();
        if (e == '"' || e == '\\' || e == '/') {
          out.push_back(e);
        } else if (e == 'b') {
          out.push_back('\b');
        } else if (e == 'f') {
          out.push_back('\f');
        } else if (e == 'n') {
          out.push_back('\n');
        } else if (e == 'r') {
          out.push_back('\r');
        } else if (e == 't') {
          out.push_back('\t');
        } else {
          add_error("unsupported escape");
          out.push_back(e);
        }
        continue;
      }
      out.push_back(c);
    }
    add_error("unterminated string");
    return std::nullopt;
  }

  std::optional<Source> parse_number() {
    skip_ws();
    const std::size_t start = i;
    if (peek() == '-') {
      get();
    }
    bool any = false;
    bool fraction = false;
    while (peek() >= '0' && peek() <= '9') {
      any = true;
      get();
    }
    if (peek() == '.') {
      fraction = true;
      get();
      while (peek() >= '0' && peek() <= '9') {
        any = true;
        get();
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      fraction = true;
      get();
      if (peek() == '+' || peek() == '-') {
        get();
      }
      while (peek() >= '0' && peek() <= '9') {
        any = true;
        get();
      }
    }
    if (!any) {
      add_error("expected number");
      return std::nullopt;
    }
    const std::string text{s.substr(start, i - start)};
    try {
      if (!fraction) {
        return Source{static_cast<std::int64_t>(std::stoll(text))};
      }
      return Source{std::stod(text)};
    } catch (const std::exception &) {
      add_error("invalid number");
      return std::nullopt;
    }
  }

  std::optional<Source> parse_value() {
    skip_ws();
    const char c = peek();
    if (c == '{') {
      return parse_object();
    }
    if (c == '[') {
      return parse_array();
    }
    if (c == '"') {
      auto str = parse_string();
      if (!str) {
        return std::nullopt;
      }
      return Source{std::move(*str)};
    }
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parse_number();
    }
    if (consume_word("true")) {
      return Source{true};
    }
    if (consume_word("false")) {
      return Source{false};
    }
    if (consume_word("null")) {
      return Source{};
    }
    add_error("unexpected token");
    return std::nullopt;
  }

  std::optional<Source> parse_object() {
    if (!consume('{')) {
      add_error("expected '{'");
      return std::nullopt;
    }
    Source::Mapping obj;
    skip_ws();
    if (consume('}')) {
      return Source{std::move(obj)};
    }
    for (;;) {
      auto k = parse_string();
      if (!k) {
        return std::nullopt;
      }
      if (!consume(':')) {
        add_error("expected ':'");
        return std::nullopt;
      }
      auto v = parse_value();
      if (!v) {
        return std::nullopt;
      }
      bool replaced = false;
      for (auto &kv : obj) {
        if (kv.first == *k) {
          kv.second = std::move(*v);
          replaced = true;
          break;
        }
      }
      if (!replaced) {
        obj.emplace_back(std::move(*k), std::move(*v));
      }
      skip_ws();
      if (consume('}')) {
        return Source{std::move(obj)};
      }
      if (!consume(',')) {
        add_error("expected ',' or '}'");
        return std::nullopt;
      }
    }
  }

  std::optional<Source> parse_array() {
    if (!consume('[')) {
      add_error("expected '['");
      return std::nullopt;
    }
    Source::Sequence arr;
    skip_ws();
    if (consume(']')) {
      return Source{std::move(arr)};
    }
    for (;;) {
      auto v = parse_value();
      if (!v) {
        return std::nullopt;
      }
      arr.push_back(std::move(*v));
      skip_ws();
      if (consume(']')) {
        return Source{std::move(arr)};
      }
      if (!consume(',')) {
        add_error("expected ',' or ']'");
        return std::nullopt;
      }
    }
  }
};

} // namespace detail

inline ParseSourceResult parse_source_json(std::string_view json) {
  ParseSourceResult out;
  detail::SourceJsonParser p;
  p.s = json;
  p.errors = &out.errors;

  auto v = p.parse_value();
  if (!v) {
    return out;
  }
  p.skip_ws();
  if (!p.eof()) {
    p.add_error("trailing characters after document");
    return out;
  }
  out.source = std::move(*v);
  return out;
}

} // namespace arbor::vdom
