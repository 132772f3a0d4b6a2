#pragma once

// Minimal JSON helpers for the compact reports this library emits.
// Getters match the first occurrence of a key anywhere in the document; they
// are meant for flat reports, not general parsing.

#include <regex>
#include <string>

namespace buildid::jsonlite {

inline std::string escape(const std::string& s) {
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
      static const char kHex[] = "0123456789abcdef";
      o += "\\u00";
      o += kHex[(c >> 4) & 0x0f];
      o += kHex[c & 0x0f];
    } else {
      o += c;
    }
  }
  return o;
}

inline std::string unescape(const std::string& in) {
  std::string o;
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\\' && i + 1 < in.size()) {
      char n = in[++i];
      if (n == 'n') o += '\n';
      else if (n == 't') o += '\t';
      else if (n == 'r') o += '\r';
      else o += n;
    } else {
      o += in[i];
    }
  }
  return o;
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return def;
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return def;
}

inline unsigned long long get_u64(const std::string& s, const std::string& key, unsigned long long def = 0) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return std::stoull(m[1].str());
  return def;
}

}  // namespace buildid::jsonlite
