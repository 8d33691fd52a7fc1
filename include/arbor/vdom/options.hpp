#pragma once

#include <arbor/vdom/log.hpp>

#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::vdom {

struct ReconcileOptions {
  std::int32_t max_depth{100};
  // A child list whose length changes by more than this share of the longer
  // list is replaced wholesale instead of reconciled item by item.
  double bailout_ratio{0.5};
  bool rediff_moves{true};
  std::string log_level{"warn"};
};

struct OptionsParseError {
  std::int32_t line{};
  std::string message;
};

struct ParseOptionsResult {
  ReconcileOptions options;
  std::vector<OptionsParseError> errors;
};

namespace detail {

using TomlScalar = std::variant<std::string, std::int64_t, double, bool>;

inline std::string_view trim_ws(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n')) {
    ++i;
  }
  std::size_t j = s.size();
  while (j > i && (s[j - 1] == ' ' || s[j - 1] == '\t' || s[j - 1] == '\r' || s[j - 1] == '\n')) {
    --j;
  }
  return s.substr(i, j - i);
}

inline std::string unescape_toml_string(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c != '\\' || i + 1 >= s.size()) {
      out.push_back(c);
      continue;
    }
    const char n = s[++i];
    if (n == 'n') {
      out.push_back('\n');
    } else if (n == 't') {
      out.push_back('\t');
    } else if (n == '\\') {
      out.push_back('\\');
    } else if (n == '"') {
      out.push_back('"');
    } else {
      out.push_back(n);
    }
  }
  return out;
}

inline std::optional<std::string> parse_toml_table_name(std::string_view line) {
  line = trim_ws(line);
  if (line.size() < 3 || line.front() != '[' || line.back() != ']') {
    return std::nullopt;
  }
  auto inner = trim_ws(line.substr(1, line.size() - 2));
  if (inner.size() >= 2 && inner.front() == '"' && inner.back() == '"') {
    return unescape_toml_string(inner.substr(1, inner.size() - 2));
  }
  return std::string{inner};
}

inline std::pair<std::string, std::string> parse_toml_kv(std::string_view line) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) {
    return {};
  }
  auto k = trim_ws(line.substr(0, pos));
  auto v = trim_ws(line.substr(pos + 1));
  if (k.size() >= 2 && k.front() == '"' && k.back() == '"') {
    k = k.substr(1, k.size() - 2);
  }
  return {std::string{k}, std::string{v}};
}

inline TomlScalar parse_toml_value(std::string_view v) {
  v = trim_ws(v);
  if (v.size() >= 2 &&
      ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
    return TomlScalar{unescape_toml_string(v.substr(1, v.size() - 2))};
  }
  if (v == "true") {
    return TomlScalar{true};
  }
  if (v == "false") {
    return TomlScalar{false};
  }
  try {
    if (v.find_first_of(".eE") != std::string_view::npos) {
      return TomlScalar{std::stod(std::string{v})};
    }
    return TomlScalar{static_cast<std::int64_t>(std::stoll(std::string{v}))};
  } catch (const std::exception &) {
    return TomlScalar{std::string{v}};
  }
}

inline std::optional<double> toml_as_number(const TomlScalar &v) {
  if (const auto *d = std::get_if<double>(&v)) {
    return *d;
  }
  if (const auto *i = std::get_if<std::int64_t>(&v)) {
    return static_cast<double>(*i);
  }
  return std::nullopt;
}

} // namespace detail

inline std::vector<std::string> validate_options(const ReconcileOptions &options) {
  std::vector<std::string> errors;
  if (options.max_depth <= 0) {
    errors.push_back("max_depth must be a positive number");
  }
  if (!(options.bailout_ratio >= 0.0 && options.bailout_ratio <= 1.0)) {
    errors.push_back("bailout_ratio must be between 0 and 1");
  }
  if (!parse_log_level(options.log_level)) {
    errors.push_back("log level must be one of: trace, debug, info, warn, "
                     "error, critical, off");
  }
  return errors;
}

inline ParseOptionsResult parse_options_toml(std::string_view toml,
                                             ReconcileOptions defaults = {}) {
  ParseOptionsResult out;
  out.options = std::move(defaults);
  std::string table;

  const auto add_error = [&](std::int32_t line, std::string msg) {
    out.errors.push_back(OptionsParseError{line, std::move(msg)});
  };

  std::size_t pos = 0;
  std::int32_t line_no = 0;
  while (pos <= toml.size()) {
    ++line_no;
    const auto next = toml.find('\n', pos);
    auto line = (next == std::string_view::npos) ? toml.substr(pos) : toml.substr(pos, next - pos);
    pos = (next == std::string_view::npos) ? toml.size() + 1 : next + 1;

    const auto hash = line.find('#');
    if (hash != std::string_view::npos) {
      line = line.substr(0, hash);
    }
    line = detail::trim_ws(line);
    if (line.empty()) {
      continue;
    }

    if (auto t = detail::parse_toml_table_name(line)) {
      table = *t;
      if (table != "reconcile" && table != "log") {
        add_error(line_no, "unknown table: " + table);
      }
      continue;
    }

    const auto kv = detail::parse_toml_kv(line);
    if (kv.first.empty()) {
      add_error(line_no, "invalid key/value");
      continue;
    }
    const auto value = detail::parse_toml_value(kv.second);

    if (table == "reconcile") {
      if (kv.first == "max_depth") {
        if (const auto *i = std::get_if<std::int64_t>(&value)) {
          if (*i < std::numeric_limits<std::int32_t>::min() ||
              *i > std::numeric_limits<std::int32_t>::max()) {
            add_error(line_no, "reconcile.max_depth is out of range");
          } else {
            out.options.max_depth = static_cast<std::int32_t>(*i);
          }
        } else {
          add_error(line_no, "reconcile.max_depth must be an integer");
        }
      } else if (kv.first == "bailout_ratio") {
        if (const auto d = detail::toml_as_number(value)) {
          out.options.bailout_ratio = *d;
        } else {
          add_error(line_no, "reconcile.bailout_ratio must be a number");
        }
      } else if (kv.first == "rediff_moves") {
        if (const auto *b = std::get_if<bool>(&value)) {
          out.options.rediff_moves = *b;
        } else {
          add_error(line_no, "reconcile.rediff_moves must be a boolean");
        }
      } else {
        add_error(line_no, "unknown key: reconcile." + kv.first);
      }
      continue;
    }

    if (table == "log") {
      if (kv.first == "level") {
        if (const auto *s = std::get_if<std::string>(&value)) {
          out.options.log_level = *s;
        } else {
          add_error(line_no, "log.level must be a string");
        }
      } else {
        add_error(line_no, "unknown key: log." + kv.first);
      }
      continue;
    }

    if (table.empty()) {
      add_error(line_no, "key/value outside any table");
    }
  }

  for (auto &msg : validate_options(out.options)) {
    add_error(0, std::move(msg));
  }

  return out;
}

inline std::optional<std::string> load_text_file(const std::string &path) {
  std::ifstream in{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool load_options_toml_file(const std::string &path,
                                   ParseOptionsResult *out_result) {
  auto s = load_text_file(path);
  if (!s) {
    logger()->warn("cannot read options file {}", path);
    return false;
  }
  auto r = parse_options_toml(*s);
  if (out_result) {
    *out_result = std::move(r);
  }
  return true;
}

// Applies the logging part of the options to the shared logger.
inline void apply_log_options(const ReconcileOptions &options) {
  if (!set_log_level(options.log_level)) {
    logger()->warn("unknown log level '{}'", options.log_level);
  }
}

} // namespace arbor::vdom
