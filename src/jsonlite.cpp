#include "symlinkio/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - Object keys come out sorted (std::map iteration order).
//   - Numbers go through std::from_chars / std::to_chars, which ignore the
//     C locale, and doubles are written in shortest round-trip form.
//   - Control characters are always written as \u00XX.

#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace symlinkio::jsonlite {

namespace {

// Nesting bound for untrusted split JSON arriving from another process.
constexpr int kMaxDepth = 64;

struct SyntaxError {
  const char* code;
  std::string message;
};

class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (pos_ != text_.size()) fail("trailing data");
    return v;
  }

 private:
  [[noreturn]] void fail(const std::string& what, const char* code = "json_parse_error") {
    throw SyntaxError{code, what + " at offset " + std::to_string(pos_)};
  }

  void skip_ws() {
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return;
      ++pos_;
    }
  }

  char peek() {
    skip_ws();
    if (pos_ >= text_.size()) fail("unexpected end of input");
    return text_[pos_];
  }

  void expect_char(char c) {
    if (peek() != c) fail(std::string("expected '") + c + "'");
    ++pos_;
  }

  bool consume_word(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) fail("nesting too deep");
    switch (peek()) {
      case '{': return Value{object(depth + 1)};
      case '[': return Value{array(depth + 1)};
      case '"': return Value{string()};
      case 't': if (consume_word("true")) return Value{true}; break;
      case 'f': if (consume_word("false")) return Value{false}; break;
      case 'n': if (consume_word("null")) return Value{nullptr}; break;
      default: return number();
    }
    fail("unexpected token");
  }

  Object object(int depth) {
    Object out;
    expect_char('{');
    if (peek() == '}') {
      ++pos_;
      return out;
    }
    while (true) {
      if (peek() != '"') fail("expected object key");
      std::string key = string();
      if (out.count(key) != 0) fail("duplicate key \"" + key + "\"", "json_duplicate_key");
      expect_char(':');
      out.emplace(std::move(key), value(depth));
      const char c = peek();
      ++pos_;
      if (c == '}') return out;
      if (c != ',') fail("expected ',' or '}'");
    }
  }

  Array array(int depth) {
    Array out;
    expect_char('[');
    if (peek() == ']') {
      ++pos_;
      return out;
    }
    while (true) {
      out.push_back(value(depth));
      const char c = peek();
      ++pos_;
      if (c == ']') return out;
      if (c != ',') fail("expected ',' or ']'");
    }
  }

  unsigned hex4() {
    if (pos_ + 4 > text_.size()) fail("truncated \\u escape");
    unsigned cp = 0;
    const auto r = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, cp, 16);
    if (r.ec != std::errc() || r.ptr != text_.data() + pos_ + 4) fail("bad \\u escape");
    pos_ += 4;
    return cp;
  }

  static void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string string() {
    expect_char('"');
    std::string out;
    while (pos_ < text_.size()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) fail("raw control character in string");
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= text_.size()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          unsigned cp = hex4();
          if (cp >= 0xD800 && cp < 0xDC00) {
            if (!consume_word("\\u")) fail("unpaired surrogate");
            const unsigned low = hex4();
            if (low < 0xDC00 || low >= 0xE000) fail("unpaired surrogate");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          append_utf8(out, cp);
          break;
        }
        default: fail(std::string("bad escape '\\") + esc + "'");
      }
    }
    fail("unterminated string");
  }

  Value number() {
    const size_t start = pos_;
    auto digits = [&] {
      const size_t from = pos_;
      while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
      return pos_ > from;
    };
    const bool negative = pos_ < text_.size() && text_[pos_] == '-';
    if (negative) ++pos_;
    if (!digits()) fail("unexpected token");
    bool integral = !negative;
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digits()) fail("digit expected after '.'");
      integral = false;
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (!digits()) fail("digit expected in exponent");
      integral = false;
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (integral) {
      std::uint64_t n = 0;
      const auto r = std::from_chars(first, last, n);
      if (r.ec == std::errc::result_out_of_range) fail("integer out of range");
      return Value{n};
    }
    double d = 0.0;
    const auto r = std::from_chars(first, last, d);
    if (r.ec != std::errc() || !std::isfinite(d)) fail("number out of range");
    return Value{d};
  }

  std::string_view text_;
  size_t pos_{0};
};

Value read_document(const std::string& text, std::optional<JsonError>* error) {
  try {
    Value v = Reader(text).document();
    if (error) error->reset();
    return v;
  } catch (const SyntaxError& e) {
    if (error) *error = JsonError{e.code, e.message};
    return Value{};
  }
}

void write_string(std::string& out, const std::string& s) {
  static const char kHex[] = "0123456789abcdef";
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += "\\u00";
          out += kHex[(c >> 4) & 0xF];
          out += kHex[c & 0xF];
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_double(std::string& out, double d) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  char buf[32];
  const auto r = std::to_chars(buf, buf + sizeof(buf), d);
  std::string_view text(buf, static_cast<size_t>(r.ptr - buf));
  out += text;
  // Keep the value a double when it is read back.
  if (text.find_first_of(".e") == std::string_view::npos) out += ".0";
}

void write(std::string& out, const Value& value) {
  std::visit(
      [&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          out += std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          write_double(out, x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          write_string(out, x);
        } else if constexpr (std::is_same_v<T, Array>) {
          out += '[';
          for (size_t i = 0; i < x.size(); ++i) {
            if (i) out += ',';
            write(out, x[i]);
          }
          out += ']';
        } else {
          out += '{';
          bool first = true;
          for (const auto& [k, v] : x) {
            if (!first) out += ',';
            first = false;
            write_string(out, k);
            out += ':';
            write(out, v);
          }
          out += '}';
        }
      },
      value.v);
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> local;
  Value v = read_document(text, &local);
  if (!local && !v.is<Object>()) {
    local = JsonError{"json_parse_error", "top-level value must be an object"};
  }
  if (error) *error = local;
  if (local) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate(const std::string& text) {
  std::optional<JsonError> err;
  read_document(text, &err);
  return err;
}

std::string to_json(const Value& v) {
  std::string out;
  write(out, v);
  return out;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  return v && v->is<std::string>() ? std::get<std::string>(v->v) : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  return v && v->is<bool>() ? std::get<bool>(v->v) : def;
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  const Value* v = find(obj, key);
  return v && v->is<std::uint64_t>() ? std::get<std::uint64_t>(v->v) : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  if (v->is<double>()) return std::get<double>(v->v);
  if (v->is<std::uint64_t>()) return static_cast<double>(std::get<std::uint64_t>(v->v));
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Value* v = find(obj, key);
  if (!v || !v->is<Array>()) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (item.is<std::string>()) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

}  // namespace symlinkio::jsonlite
