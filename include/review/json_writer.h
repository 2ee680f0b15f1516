#pragma once

#include <review/models.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace review {

std::string EscapeJsonString(const std::string &value);

// Streaming pretty-printer: one member per line, "[]" and "{}" for empty
// containers.
class JsonWriter {
public:
  explicit JsonWriter(int indent = 2);

  JsonWriter &BeginObject();
  JsonWriter &EndObject();
  JsonWriter &BeginArray();
  JsonWriter &EndArray();
  JsonWriter &Key(const std::string &key);
  JsonWriter &String(const std::string &value);
  JsonWriter &Int(std::int64_t value);
  JsonWriter &Bool(bool value);
  JsonWriter &Null();

  std::string str() const { return output_.str(); }

private:
  struct Scope {
    bool is_object = false;
    std::size_t members = 0;
  };

  void BeginValue();
  void NewLine(std::size_t depth);
  void Close(bool is_object, char bracket);

  int indent_;
  std::ostringstream output_;
  std::vector<Scope> scopes_;
  bool after_key_ = false;
};

void WriteJson(JsonWriter &writer, const Finding &finding);
void WriteJson(JsonWriter &writer, const TokenUsage &usage);
void WriteJson(JsonWriter &writer, const FileDiff &file);
void WriteJson(JsonWriter &writer, const ParsedDiff &diff);

} // namespace review
