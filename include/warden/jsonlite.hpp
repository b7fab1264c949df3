#pragma once

// warden/jsonlite.hpp — Flat-document JSON field extraction.
//
// Config files, dead-letter envelopes and CLI inputs are flat JSON objects
// with scalar values (plus one string array and one string map). These helpers
// pull single fields out by key; they are not a general parser.
//
// Numeric readers never throw: an out-of-range value reads as absent.
//
// INVARIANT: keys are matched literally. Callers must not pass keys that
// contain regex metacharacters.

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace warden::jsonlite {

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

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s) {
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\n') o += "\\n";
    else if (c == '\t') o += "\\t";
    else if (c == '\r') o += "\\r";
    else o += c;
  }
  return o;
}

inline bool has_key(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:");
  return std::regex_search(s, re);
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

// Checked numeric conversions: false on trailing junk or a value the target
// type cannot hold.
inline bool to_u64(const std::string& tok, unsigned long long* out) {
  if (tok.empty() || tok[0] == '-') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(tok.c_str(), &end, 10);
  if (errno == ERANGE || end == tok.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

inline bool to_i64(const std::string& tok, long long* out) {
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(tok.c_str(), &end, 10);
  if (errno == ERANGE || end == tok.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

inline bool to_double(const std::string& tok, double* out) {
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(tok.c_str(), &end);
  if (errno == ERANGE || end == tok.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

// find_*: false when the key is absent or its value does not convert.
inline bool find_u64(const std::string& s, const std::string& key, unsigned long long* out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  return std::regex_search(s, m, re) && to_u64(m[1].str(), out);
}

inline bool find_i64(const std::string& s, const std::string& key, long long* out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  return std::regex_search(s, m, re) && to_i64(m[1].str(), out);
}

inline bool find_double(const std::string& s, const std::string& key, double* out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?(?:[eE][-+]?[0-9]+)?)");
  std::smatch m;
  return std::regex_search(s, m, re) && to_double(m[1].str(), out);
}

inline unsigned long long get_u64(const std::string& s, const std::string& key, unsigned long long def = 0) {
  unsigned long long v = 0;
  return find_u64(s, key, &v) ? v : def;
}

inline long long get_i64(const std::string& s, const std::string& key, long long def = 0) {
  long long v = 0;
  return find_i64(s, key, &v) ? v : def;
}

inline double get_double(const std::string& s, const std::string& key, double def = 0.0) {
  double v = 0.0;
  return find_double(s, key, &v) ? v : def;
}

inline std::vector<std::string> get_string_array(const std::string& s, const std::string& key) {
  std::vector<std::string> out;
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\[([^\\]]*)\\]");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return out;
  std::regex item("\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  auto begin = std::sregex_iterator(m[1].first, m[1].second, item);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) out.push_back(unescape((*it)[1].str()));
  return out;
}

inline std::map<std::string, std::string> get_string_map(const std::string& s, const std::string& key) {
  std::map<std::string, std::string> out;
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\{([^\\}]*)\\}");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return out;
  std::regex item("\\\"([^\\\"]*)\\\"\\s*:\\s*\\\"([^\\\"]*)\\\"");
  auto begin = std::sregex_iterator(m[1].first, m[1].second, item);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) out[unescape((*it)[1].str())] = unescape((*it)[2].str());
  return out;
}

// Fixed six-decimal rendering with trailing zeros trimmed ("1.5", "80", "0.25").
inline std::string format_double(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.6f", v);
  std::string out(buf);
  const auto dot = out.find('.');
  if (dot != std::string::npos) {
    while (!out.empty() && out.back() == '0') out.pop_back();
    if (!out.empty() && out.back() == '.') out.pop_back();
  }
  return out;
}

}  // namespace warden::jsonlite
