// Repository: Redub
// Component: Flat JSON Helpers
// Purpose: Minimal writer/reader for single-object JSON records (config file,
//          job store artifacts, JSONL ledgers). Keys are unique and values are
//          scalars; nested objects and arrays are not supported.
// Copyright (c) 2026 Redub

#ifndef REDUB_CORE_FLAT_JSON_HPP_
#define REDUB_CORE_FLAT_JSON_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace redub::core {

std::string JsonEscape(const std::string& s);

bool JsonHasKey(const std::string& json, const std::string& key);

// Each Find* returns false when the key is absent or its value has the wrong
// type; |out| is left untouched in that case.
bool JsonFindString(const std::string& json, const std::string& key, std::string* out);
bool JsonFindInt64(const std::string& json, const std::string& key, int64_t* out);
bool JsonFindDouble(const std::string& json, const std::string& key, double* out);
bool JsonFindBool(const std::string& json, const std::string& key, bool* out);

// A line is a complete record when it is a single {...} object.
bool IsCompleteJsonObject(const std::string& line);

// Builder for one flat JSON object; fields are emitted in insertion order.
class JsonObjectWriter {
 public:
  JsonObjectWriter& Add(const std::string& key, const std::string& value);
  JsonObjectWriter& Add(const std::string& key, const char* value);
  JsonObjectWriter& Add(const std::string& key, int64_t value);
  JsonObjectWriter& Add(const std::string& key, int32_t value);
  JsonObjectWriter& Add(const std::string& key, uint64_t value);
  JsonObjectWriter& Add(const std::string& key, double value);
  JsonObjectWriter& Add(const std::string& key, bool value);
  // |raw_json| is inserted verbatim (array or object built elsewhere).
  JsonObjectWriter& AddRaw(const std::string& key, const std::string& raw_json);

  std::string str() const { return "{" + body_.str() + "}"; }

 private:
  void Key(const std::string& key);

  std::ostringstream body_;
  bool first_ = true;
};

}  // namespace redub::core

#endif  // REDUB_CORE_FLAT_JSON_HPP_
