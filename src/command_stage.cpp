#include <review/command_stage.h>
#include <review/json_writer.h>
#include <review/process.h>

#include <chrono>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace review {
namespace {

std::optional<std::string> ScalarField(const YAML::Node &node,
                                       const char *key) {
  const auto value = node[key];
  if (!value || !value.IsScalar()) {
    return std::nullopt;
  }
  return value.as<std::string>();
}

std::optional<int> IntegerField(const YAML::Node &node, const char *key) {
  const auto value = node[key];
  if (!value || !value.IsScalar()) {
    return std::nullopt;
  }
  try {
    return value.as<int>();
  } catch (const YAML::BadConversion &) {
    return std::nullopt;
  }
}

std::optional<Finding> ToFinding(const YAML::Node &node) {
  if (!node.IsMap()) {
    return std::nullopt;
  }
  const auto type = ScalarField(node, "type");
  const auto severity = ScalarField(node, "severity");
  const auto category = ScalarField(node, "category");
  const auto message = ScalarField(node, "message");
  const auto file = ScalarField(node, "file");
  if (!type || !severity || !category || !message || !file) {
    return std::nullopt;
  }

  const auto kind = ParseFindingKind(*type);
  const auto rank = ParseSeverity(*severity);
  if (!kind || !rank || message->empty() || file->empty()) {
    return std::nullopt;
  }

  Finding finding;
  finding.kind = *kind;
  finding.severity = *rank;
  finding.category = *category;
  finding.message = *message;
  finding.file = *file;
  finding.line = IntegerField(node, "line");
  finding.suggestion = ScalarField(node, "suggestion");
  finding.code = ScalarField(node, "code");
  return finding;
}

std::optional<TokenUsage> ToTokenUsage(const YAML::Node &node) {
  if (!node || !node.IsMap()) {
    return std::nullopt;
  }
  const auto field = [&](const char *snake, const char *camel) {
    if (const auto value = IntegerField(node, snake)) {
      return *value;
    }
    return IntegerField(node, camel).value_or(0);
  };
  TokenUsage usage;
  usage.prompt_tokens = field("prompt_tokens", "promptTokens");
  usage.completion_tokens = field("completion_tokens", "completionTokens");
  usage.total_tokens = field("total_tokens", "totalTokens");
  if (usage.total_tokens == 0) {
    usage.total_tokens = usage.prompt_tokens + usage.completion_tokens;
  }
  return usage;
}

std::optional<YAML::Node> TryLoad(const std::string &text) {
  try {
    return YAML::Load(text);
  } catch (const YAML::Exception &) {
    return std::nullopt;
  }
}

// Language models tend to wrap the JSON array in prose or code fences.
std::optional<YAML::Node> LoadEmbeddedArray(const std::string &output) {
  const auto open = output.find('[');
  const auto close = output.rfind(']');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    return std::nullopt;
  }
  auto node = TryLoad(output.substr(open, close - open + 1));
  if (!node || !node->IsSequence()) {
    return std::nullopt;
  }
  return node;
}

std::string FirstWord(const std::string &command) {
  std::istringstream stream(command);
  std::string word;
  stream >> word;
  return word;
}

} // namespace

std::string SerializeStageContext(const std::string &stage_name,
                                  const StageContext &context) {
  JsonWriter writer;
  writer.BeginObject();
  writer.Key("stage").String(stage_name);
  writer.Key("diff");
  WriteJson(writer, context.diff);
  writer.Key("previous_findings").BeginArray();
  if (context.previous_findings) {
    for (const auto &finding : *context.previous_findings) {
      WriteJson(writer, finding);
    }
  }
  writer.EndArray();
  writer.EndObject();
  return writer.str();
}

FindingsPayload ParseFindingsPayload(const std::string &output,
                                     Logger &logger) {
  YAML::Node findings;
  YAML::Node usage;

  const auto document = TryLoad(output);
  if (document && document->IsSequence()) {
    findings = *document;
  } else if (document && document->IsMap() && (*document)["findings"] &&
             (*document)["findings"].IsSequence()) {
    findings = (*document)["findings"];
    usage = (*document)["token_usage"];
  } else if (const auto embedded = LoadEmbeddedArray(output)) {
    findings = *embedded;
  } else {
    throw StageFailure("No JSON array of findings found in stage output");
  }

  FindingsPayload payload;
  std::size_t dropped = 0;
  for (const auto &entry : findings) {
    if (auto finding = ToFinding(entry)) {
      payload.findings.push_back(std::move(*finding));
    } else {
      ++dropped;
    }
  }
  if (dropped > 0) {
    logger.Log(LogLevel::kWarn, "stage.findings.dropped",
               {{"count", std::to_string(dropped)}});
  }
  payload.token_usage = ToTokenUsage(usage);
  return payload;
}

CommandStage::CommandStage(StageSpec spec, std::shared_ptr<Logger> logger)
    : spec_(std::move(spec)), logger_(EnsureLogger(std::move(logger))) {
  if (spec_.name.empty()) {
    throw std::invalid_argument("Stage name cannot be empty");
  }
  if (FirstWord(spec_.command).empty()) {
    throw std::invalid_argument("Stage '" + spec_.name +
                                "' has no command configured");
  }
}

void CommandStage::Prepare() {
  const auto program = FirstWord(spec_.command);
  if (!FindExecutable(program)) {
    throw std::runtime_error("Stage '" + spec_.name +
                             "': command not found: " + program);
  }
}

StageResult CommandStage::Run(const StageContext &context) {
  const auto start = std::chrono::steady_clock::now();

  ProcessOptions options;
  options.stdin_input = SerializeStageContext(spec_.name, context);
  options.environment = {{"REVIEW_STAGE", spec_.name}};

  logger_->Log(LogLevel::kDebug, "stage.command.start",
               {{"stage", spec_.name},
                {"command", spec_.command},
                {"input_bytes", std::to_string(options.stdin_input.size())}});

  const auto process = RunShellCommand(spec_.command, options);
  if (process.exit_code != 0) {
    throw StageFailure("Stage '" + spec_.name + "' exited with status " +
                       std::to_string(process.exit_code) +
                       (process.stderr_output.empty()
                            ? ""
                            : ": " + process.stderr_output));
  }

  auto payload = ParseFindingsPayload(process.stdout_output, *logger_);

  StageResult result;
  result.stage_name = spec_.name;
  result.findings = std::move(payload.findings);
  result.token_usage = payload.token_usage;
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return result;
}

} // namespace review
