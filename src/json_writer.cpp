#include <review/json_writer.h>

#include <iomanip>
#include <stdexcept>
#include <unordered_map>

namespace review {

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"}, {'\r', "\\r"},
      {'\t', "\\t"}, {'\b', "\\b"},  {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
      continue;
    }
    if (static_cast<unsigned char>(character) < 0x20) {
      std::ostringstream code;
      code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(static_cast<unsigned char>(character));
      escaped.append(code.str());
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

JsonWriter::JsonWriter(int indent) : indent_(indent) {}

void JsonWriter::NewLine(std::size_t depth) {
  output_ << '\n' << std::string(depth * static_cast<std::size_t>(indent_), ' ');
}

void JsonWriter::BeginValue() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (scopes_.empty()) {
    return;
  }
  auto &scope = scopes_.back();
  if (scope.is_object) {
    throw std::logic_error("JSON object member written without a key");
  }
  if (scope.members > 0) {
    output_ << ',';
  }
  ++scope.members;
  NewLine(scopes_.size());
}

void JsonWriter::Close(bool is_object, char bracket) {
  if (scopes_.empty() || scopes_.back().is_object != is_object || after_key_) {
    throw std::logic_error("Unbalanced JSON container");
  }
  const auto members = scopes_.back().members;
  scopes_.pop_back();
  if (members > 0) {
    NewLine(scopes_.size());
  }
  output_ << bracket;
}

JsonWriter &JsonWriter::BeginObject() {
  BeginValue();
  output_ << '{';
  scopes_.push_back(Scope{true, 0});
  return *this;
}

JsonWriter &JsonWriter::EndObject() {
  Close(true, '}');
  return *this;
}

JsonWriter &JsonWriter::BeginArray() {
  BeginValue();
  output_ << '[';
  scopes_.push_back(Scope{false, 0});
  return *this;
}

JsonWriter &JsonWriter::EndArray() {
  Close(false, ']');
  return *this;
}

JsonWriter &JsonWriter::Key(const std::string &key) {
  if (scopes_.empty() || !scopes_.back().is_object || after_key_) {
    throw std::logic_error("JSON key written outside of an object");
  }
  auto &scope = scopes_.back();
  if (scope.members > 0) {
    output_ << ',';
  }
  ++scope.members;
  NewLine(scopes_.size());
  output_ << '"' << EscapeJsonString(key) << "\": ";
  after_key_ = true;
  return *this;
}

JsonWriter &JsonWriter::String(const std::string &value) {
  BeginValue();
  output_ << '"' << EscapeJsonString(value) << '"';
  return *this;
}

JsonWriter &JsonWriter::Int(std::int64_t value) {
  BeginValue();
  output_ << value;
  return *this;
}

JsonWriter &JsonWriter::Bool(bool value) {
  BeginValue();
  output_ << (value ? "true" : "false");
  return *this;
}

JsonWriter &JsonWriter::Null() {
  BeginValue();
  output_ << "null";
  return *this;
}

void WriteJson(JsonWriter &writer, const Finding &finding) {
  writer.BeginObject();
  writer.Key("type").String(ToString(finding.kind));
  writer.Key("severity").String(ToString(finding.severity));
  writer.Key("category").String(finding.category);
  writer.Key("message").String(finding.message);
  writer.Key("file").String(finding.file);
  if (finding.line) {
    writer.Key("line").Int(*finding.line);
  }
  if (finding.suggestion) {
    writer.Key("suggestion").String(*finding.suggestion);
  }
  if (finding.code) {
    writer.Key("code").String(*finding.code);
  }
  writer.EndObject();
}

void WriteJson(JsonWriter &writer, const TokenUsage &usage) {
  writer.BeginObject();
  writer.Key("prompt_tokens").Int(usage.prompt_tokens);
  writer.Key("completion_tokens").Int(usage.completion_tokens);
  writer.Key("total_tokens").Int(usage.total_tokens);
  writer.EndObject();
}

void WriteJson(JsonWriter &writer, const FileDiff &file) {
  writer.BeginObject();
  writer.Key("path").String(file.path);
  if (file.old_path) {
    writer.Key("old_path").String(*file.old_path);
  }
  writer.Key("status").String(ToString(file.status));
  writer.Key("additions").Int(file.additions);
  writer.Key("deletions").Int(file.deletions);
  writer.Key("changes").BeginArray();
  for (const auto &change : file.changes) {
    writer.BeginObject();
    writer.Key("type").String(ToString(change.kind));
    writer.Key("line").Int(change.line_number);
    writer.Key("content").String(change.content);
    writer.EndObject();
  }
  writer.EndArray();
  writer.EndObject();
}

void WriteJson(JsonWriter &writer, const ParsedDiff &diff) {
  writer.BeginObject();
  writer.Key("summary").String(diff.summary);
  writer.Key("total_additions").Int(diff.total_additions);
  writer.Key("total_deletions").Int(diff.total_deletions);
  writer.Key("files").BeginArray();
  for (const auto &file : diff.files) {
    WriteJson(writer, file);
  }
  writer.EndArray();
  writer.EndObject();
}

} // namespace review
