// Repository: Redub
// Component: Flat JSON Helpers Implementation
// Copyright (c) 2026 Redub

#include "redub/core/FlatJson.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

namespace redub::core {

namespace {

void SkipSpace(const std::string& s, size_t* pos) {
  while (*pos < s.size() && std::isspace(static_cast<unsigned char>(s[*pos]))) ++(*pos);
}

// Position of the first value character for |key|, or npos. A quoted match
// only counts when followed by ':' (a string value equal to the key name is
// skipped).
size_t FindValueStart(const std::string& json, const std::string& key) {
  const std::string search = "\"" + key + "\"";
  size_t pos = 0;
  while ((pos = json.find(search, pos)) != std::string::npos) {
    size_t p = pos + search.size();
    SkipSpace(json, &p);
    if (p < json.size() && json[p] == ':') {
      ++p;
      SkipSpace(json, &p);
      return p;
    }
    pos += search.size();
  }
  return std::string::npos;
}

// Raw scalar token (number / true / false / null) starting at |start|.
std::string ScalarToken(const std::string& json, size_t start) {
  size_t end = start;
  while (end < json.size() && json[end] != ',' && json[end] != '}' &&
         json[end] != ']' && !std::isspace(static_cast<unsigned char>(json[end]))) {
    ++end;
  }
  return json.substr(start, end - start);
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

bool JsonHasKey(const std::string& json, const std::string& key) {
  return FindValueStart(json, key) != std::string::npos;
}

bool JsonFindString(const std::string& json, const std::string& key, std::string* out) {
  size_t start = FindValueStart(json, key);
  if (start == std::string::npos || start >= json.size() || json[start] != '"') return false;
  std::string value;
  for (size_t i = start + 1; i < json.size(); ++i) {
    if (json[i] == '\\' && i + 1 < json.size()) {
      char next = json[i + 1];
      if (next == '"') { value += '"'; ++i; continue; }
      if (next == '\\') { value += '\\'; ++i; continue; }
      if (next == '/') { value += '/'; ++i; continue; }
      if (next == 'n') { value += '\n'; ++i; continue; }
      if (next == 'r') { value += '\r'; ++i; continue; }
      if (next == 't') { value += '\t'; ++i; continue; }
      if (next == 'u' && i + 5 < json.size()) {
        unsigned long cp = std::strtoul(json.substr(i + 2, 4).c_str(), nullptr, 16);
        // Only the control-character escapes JsonEscape emits are decoded.
        if (cp < 0x80) value += static_cast<char>(cp);
        i += 5;
        continue;
      }
    }
    if (json[i] == '"') {
      *out = value;
      return true;
    }
    value += json[i];
  }
  return false;
}

bool JsonFindInt64(const std::string& json, const std::string& key, int64_t* out) {
  size_t start = FindValueStart(json, key);
  if (start == std::string::npos) return false;
  std::string token = ScalarToken(json, start);
  if (token.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(token.c_str(), &end, 10);
  if (errno != 0 || end == token.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

bool JsonFindDouble(const std::string& json, const std::string& key, double* out) {
  size_t start = FindValueStart(json, key);
  if (start == std::string::npos) return false;
  std::string token = ScalarToken(json, start);
  if (token.empty()) return false;
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(token.c_str(), &end);
  if (errno != 0 || end == token.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

bool JsonFindBool(const std::string& json, const std::string& key, bool* out) {
  size_t start = FindValueStart(json, key);
  if (start == std::string::npos) return false;
  std::string token = ScalarToken(json, start);
  if (token == "true") { *out = true; return true; }
  if (token == "false") { *out = false; return true; }
  return false;
}

bool IsCompleteJsonObject(const std::string& line) {
  if (line.size() < 2 || line.front() != '{' || line.back() != '}') return false;
  int depth = 0;
  bool in_string = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_string) {
      if (c == '\\') { ++i; continue; }
      if (c == '"') in_string = false;
      continue;
    }
    if (c == '"') in_string = true;
    else if (c == '{' || c == '[') ++depth;
    else if (c == '}' || c == ']') {
      if (--depth < 0) return false;
      if (depth == 0 && i + 1 != line.size()) return false;
    }
  }
  return depth == 0 && !in_string;
}

// -----------------------------------------------------------------------------
// JsonObjectWriter
// -----------------------------------------------------------------------------

void JsonObjectWriter::Key(const std::string& key) {
  if (!first_) body_ << ',';
  first_ = false;
  body_ << '"' << JsonEscape(key) << "\":";
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, const std::string& value) {
  Key(key);
  body_ << '"' << JsonEscape(value) << '"';
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, const char* value) {
  return Add(key, std::string(value ? value : ""));
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, int64_t value) {
  Key(key);
  body_ << value;
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, int32_t value) {
  return Add(key, static_cast<int64_t>(value));
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, uint64_t value) {
  Key(key);
  body_ << value;
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, double value) {
  Key(key);
  body_ << std::setprecision(10) << value;
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, bool value) {
  Key(key);
  body_ << (value ? "true" : "false");
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddRaw(const std::string& key, const std::string& raw_json) {
  Key(key);
  body_ << raw_json;
  return *this;
}

}  // namespace redub::core
