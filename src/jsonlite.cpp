#include "energybench/jsonlite.hpp"

// Numbers: non-negative integers parse as uint64, everything else as double.
// format_double() prints "%.6f" with trailing zeros trimmed; snprintf is
// locale-independent for the decimal point in the C locale the tool runs in.

#include <cctype>
#include <cstdio>
#include <sstream>

namespace energybench::jsonlite {

namespace {

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void fail(const std::string& code, const std::string& message) {
    if (!err) err = JsonError{code, message, i};
  }

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  void append_utf8(std::string& o, unsigned cp) {
    if (cp < 0x80) {
      o += static_cast<char>(cp);
    } else if (cp < 0x800) {
      o += static_cast<char>(0xC0 | (cp >> 6));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      o += static_cast<char>(0xE0 | (cp >> 12));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      o += static_cast<char>(0xF0 | (cp >> 18));
      o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool parse_hex4(unsigned& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<unsigned>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<unsigned>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("json_parse_error", "expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') {
          unsigned cp = 0;
          if (!parse_hex4(cp)) { fail("json_parse_error", "invalid \\u escape"); return {}; }
          if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("json_parse_error", "unpaired low surrogate");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (!(i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u')) {
              fail("json_parse_error", "unpaired high surrogate");
              return {};
            }
            i += 2;
            unsigned lo = 0;
            if (!parse_hex4(lo)) { fail("json_parse_error", "invalid \\u escape"); return {}; }
            if (lo < 0xDC00 || lo > 0xDFFF) {
              fail("json_parse_error", "high surrogate not followed by a low surrogate");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
        }
        else o += n;
      } else {
        o += c;
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num = s.substr(start, i - start);
    try {
      if (is_float || num[0] == '-') {
        out_val = Value{std::stod(num)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num))};
      }
      return true;
    } catch (const std::exception&) {
      fail("json_parse_error", "number out of range");
      return false;
    }
  }

  Value parse_any(int depth) {
    ws();
    if (depth > 64) { fail("json_parse_error", "nesting too deep"); return {}; }
    if (i >= s.size()) { fail("json_parse_error", "unexpected eof"); return {}; }
    if (s[i] == '{') return Value{parse_object(depth)};
    if (s[i] == '[') return Value{parse_array(depth)};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    fail("json_parse_error", "unexpected token");
    return {};
  }

  Object parse_object(int depth) {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      ws();
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { fail("json_duplicate_key", "duplicate key: " + k); break; }
      if (!eat(':')) { fail("json_parse_error", "expected :"); break; }
      out[k] = parse_any(depth + 1);
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("json_parse_error", "expected ,"); break; }
    }
    return out;
  }

  Array parse_array(int depth) {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_any(depth + 1));
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("json_parse_error", "expected ,"); break; }
    }
    return out;
  }
};

}  // namespace

std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else                 o += c;
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) {
      if (!first) oss << ",";
      first = false;
      oss << "\"" << escape(k) << "\":" << to_json(vv);
    }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_any(0);
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("json_parse_error", "trailing data");
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> local;
  Value v = parse_value(text, &local);
  if (!local && !std::holds_alternative<Object>(v.v)) {
    local = JsonError{"json_parse_error", "root must be an object", 0};
  }
  if (error) *error = local;
  if (local) return {};
  return std::get<Object>(v.v);
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  }
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

}  // namespace energybench::jsonlite
