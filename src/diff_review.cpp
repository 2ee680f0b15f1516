#include <review/cli_exit_codes.h>
#include <review/component_registry.h>
#include <review/diff_review.h>
#include <review/git_diff_source.h>
#include <review/report_extractor.h>
#include <review/review_pipeline_builder.h>
#include <review/unified_diff_parser.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using review::ExtractOptions;
using review::ReviewOptions;
using review::StageSpec;

constexpr const char kDefaultCommit[] = "HEAD";
constexpr const char kDefaultOutputDirectory[] = "reports";

void PrintReviewUsage() {
  std::cout
      << "Usage: diff-review review [options]\n"
      << "Options:\n"
      << "  --commit <ref>          Commit to review (default: HEAD)\n"
      << "  --base <ref>            Compare against <ref> instead of the\n"
      << "                          commit's parent\n"
      << "  --file <path>           Read a unified diff from a file instead\n"
      << "                          of git\n"
      << "  --repo <path>           Git repository (default: .)\n"
      << "  --out <dir>             Directory for report outputs (default:\n"
      << "                          ./reports)\n"
      << "  --format <list>         Comma-separated list of output formats\n"
      << "                          (supported: markdown,json)\n"
      << "  --extensions <list>     File extensions to review (default:\n"
      << "                          .ts,.tsx,.js,.jsx)\n"
      << "  --disable-stage <list>  Comma-separated stage names to skip\n"
      << "  --fail-on <severity>    Exit with 2 when a finding at or above\n"
      << "                          <severity> is reported\n"
      << "  --config <file>         Optional YAML config file\n"
      << "  --log-level <level>     Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose               Shortcut for --log-level info\n"
      << "  --debug                 Shortcut for --log-level debug\n"
      << "  --help                  Show this message\n";
}

void PrintExtractUsage() {
  std::cout << "Usage: diff-review extract <report.md> [options]\n"
            << "Options:\n"
            << "  --format <format>  Output format: markdown or json\n"
            << "                     (default: markdown)\n"
            << "  --out <file>       Write the selection to <file> instead\n"
            << "                     of stdout\n"
            << "  --help             Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

review::Severity ParseFailOn(const std::string &value) {
  const auto severity = review::ParseSeverity(Trim(value));
  if (!severity) {
    throw std::invalid_argument("Unknown severity: " + value +
                                " (expected critical, high, medium or low)");
  }
  return *severity;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  const auto supported = review::GlobalComponentRegistry().RendererFormats();
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format.empty()) {
      continue;
    }
    if (std::find(supported.begin(), supported.end(), format) ==
        supported.end()) {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

void AppendExtensions(const std::string &raw_extensions,
                      std::vector<std::string> &target) {
  for (auto extension : SplitList(raw_extensions)) {
    extension = Trim(extension);
    if (extension.empty()) {
      continue;
    }
    if (extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    if (std::find(target.begin(), target.end(), extension) == target.end()) {
      target.push_back(std::move(extension));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        review::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = review::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = review::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleSourceOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--commit" || argument == "-c") {
    options.commit = RequireValue(arguments, index, "--commit");
    return true;
  }
  if (argument == "--base") {
    options.base = RequireValue(arguments, index, "--base");
    return true;
  }
  if (argument == "--file" || argument == "-f") {
    options.diff_file = RequireValue(arguments, index, "--file");
    return true;
  }
  if (argument == "--repo") {
    options.repository = RequireValue(arguments, index, "--repo");
    return true;
  }
  if (argument == "--extensions") {
    AppendExtensions(RequireValue(arguments, index, "--extensions"),
                     options.extensions);
    return true;
  }
  return false;
}

bool DispatchReviewOption(const std::vector<std::string> &arguments,
                          std::size_t &index, ReviewOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--out" || argument == "--output") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  if (argument == "--disable-stage") {
    AppendValues(RequireValue(arguments, index, "--disable-stage"),
                 options.disabled_stages);
    return true;
  }
  if (argument == "--fail-on") {
    options.fail_on = ParseFailOn(RequireValue(arguments, index, "--fail-on"));
    return true;
  }
  if (HandleSourceOption(arguments, index, options)) {
    return true;
  }
  return HandleLoggingOption(arguments, index, options);
}

std::string DescribeDiff(const review::ParsedDiff &diff) {
  return std::to_string(diff.files.size()) + " file(s): " + diff.summary;
}

std::string FormatSeconds(std::chrono::milliseconds elapsed) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2)
         << static_cast<double>(elapsed.count()) / 1000.0 << "s";
  return stream.str();
}

std::string Uppercase(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

void WriteTextFile(const std::filesystem::path &path,
                   const std::string &content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream stream(path, std::ios::binary | std::ios::trunc);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
  if (!stream) {
    throw std::runtime_error("Failed to write output file: " + path.string());
  }
}

} // namespace

namespace review {

const std::vector<StageSpec> &DefaultStageSpecs() {
  static const std::vector<StageSpec> stages = {
      StageSpec{"code-review", "command", "diff-review-code-review", true},
      StageSpec{"security", "command", "diff-review-security", true},
      StageSpec{"performance", "command", "diff-review-performance", true}};
  return stages;
}

ReviewOptions ParseReviewArguments(const std::vector<std::string> &arguments) {
  ReviewOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchReviewOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

using ConfigValue = std::variant<std::string, std::vector<std::string>,
                                 std::vector<StageSpec>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "repo",       "commit",    "base",    "file",
      "out",        "formats",   "extensions", "log_level",
      "fail_on",    "disabled_stages", "stages"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"repository", "repo"},
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"diff_file", "file"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

StageSpec ExtractStage(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw std::invalid_argument(
        "Config key 'stages' must be a list of stage mappings");
  }
  StageSpec spec;
  for (const auto &field : node) {
    const auto name = ToLower(Trim(field.first.as<std::string>()));
    if (name == "name") {
      spec.name = ExtractStringScalar(field.second, "stages.name");
    } else if (name == "kind") {
      spec.kind = ExtractStringScalar(field.second, "stages.kind");
    } else if (name == "command") {
      spec.command = ExtractStringScalar(field.second, "stages.command");
    } else if (name == "enabled") {
      spec.enabled = ExtractBool(field.second, "stages.enabled");
    } else {
      throw std::invalid_argument("Unknown stage key: " + name +
                                  ". Supported keys: name, kind, command, "
                                  "enabled");
    }
  }
  if (Trim(spec.name).empty()) {
    throw std::invalid_argument("Every configured stage needs a name");
  }
  return spec;
}

std::vector<StageSpec> ExtractStages(const YAML::Node &node) {
  if (!node.IsSequence()) {
    throw std::invalid_argument(
        "Config key 'stages' must be a list of stage mappings");
  }
  std::vector<StageSpec> stages;
  for (const auto &child : node) {
    stages.push_back(ExtractStage(child));
  }
  return stages;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "extensions") {
    return ExtractList(node, key, AppendExtensions);
  }
  if (key == "disabled_stages") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "stages") {
    return ExtractStages(node);
  }
  if (key == "repo" || key == "commit" || key == "base" || key == "file" ||
      key == "out" || key == "log_level" || key == "fail_on") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, ReviewOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "repo") {
      options.repository = std::get<std::string>(value);
      continue;
    }
    if (key == "commit") {
      options.commit = std::get<std::string>(value);
      continue;
    }
    if (key == "base") {
      options.base = std::get<std::string>(value);
      continue;
    }
    if (key == "file") {
      options.diff_file = std::get<std::string>(value);
      continue;
    }
    if (key == "out") {
      options.output_directory = std::get<std::string>(value);
      continue;
    }
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "extensions") {
      options.extensions = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "disabled_stages") {
      options.disabled_stages = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "stages") {
      options.stages = std::get<std::vector<StageSpec>>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    if (key == "fail_on") {
      options.fail_on = ParseFailOn(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}

ReviewOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  ReviewOptions options;
  options.config_file = path;
  RawConfig config = ParseYamlConfig(path);
  ApplyConfig(config, options);

  return options;
}

ReviewOptions MergeOptions(const ReviewOptions &config_options,
                           const ReviewOptions &cli_options) {
  ReviewOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.repository, cli_options.repository);
  override_value(merged.commit, cli_options.commit);
  override_value(merged.base, cli_options.base);
  override_value(merged.diff_file, cli_options.diff_file);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.stages, cli_options.stages);
  override_value(merged.fail_on, cli_options.fail_on);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  if (!cli_options.extensions.empty()) {
    merged.extensions = cli_options.extensions;
  }
  if (!cli_options.disabled_stages.empty()) {
    merged.disabled_stages = cli_options.disabled_stages;
  }
  return merged;
}

ReviewOptions ResolveReviewOptions(const ReviewOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  ReviewOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  return MergeOptions(config_options, cli_options);
}

std::vector<StageSpec> ResolveStageSpecs(const ReviewOptions &options) {
  auto specs = options.stages.value_or(DefaultStageSpecs());
  for (const auto &disabled : options.disabled_stages) {
    const auto found =
        std::find_if(specs.begin(), specs.end(), [&](const StageSpec &spec) {
          return spec.name == disabled;
        });
    if (found == specs.end()) {
      throw std::invalid_argument("Cannot disable unknown stage: " + disabled);
    }
    found->enabled = false;
  }
  return specs;
}

ExtractOptions ParseExtractArguments(const std::vector<std::string> &arguments) {
  ExtractOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--format") {
      const auto format = ToLower(Trim(RequireValue(arguments, i, "--format")));
      if (format != "markdown" && format != "json") {
        throw std::invalid_argument("Unsupported extract format: " + format);
      }
      options.format = format;
      continue;
    }
    if (argument == "--out") {
      options.output_file = RequireValue(arguments, i, "--out");
      continue;
    }
    if (argument.rfind('-', 0) != 0 && !options.report) {
      options.report = argument;
      continue;
    }
    throw std::invalid_argument("Unknown extract argument: " + argument);
  }
  return options;
}

void PrintReviewSummary(const PipelineOutcome &outcome, std::ostream &stream) {
  if (!outcome.report) {
    return;
  }
  const auto &report = *outcome.report;
  const auto &summary = report.summary;
  stream << "Summary:\n";
  stream << "  Total findings: " << summary.total_findings << "\n";
  stream << "  Critical: " << summary.critical << "\n";
  stream << "  High: " << summary.high << "\n";
  stream << "  Medium: " << summary.medium << "\n";
  stream << "  Low: " << summary.low << "\n";

  stream << "\nBy stage:\n";
  for (const auto &stage : report.stages) {
    stream << "  " << stage.stage_name << ": " << stage.findings.size();
    if (stage.failed) {
      stream << " (failed: " << stage.error << ")";
    }
    stream << "\n";
  }

  if (report.token_usage) {
    stream << "\nToken usage:\n";
    stream << "  Total: " << report.token_usage->total << "\n";
  }

  if (!outcome.outputs.empty()) {
    stream << "\nReports:\n";
    for (const auto &output : outcome.outputs) {
      stream << "  " << Uppercase(output.format) << ": " << output.path
             << "\n";
    }
  }

  stream << "\nExecution time: " << FormatSeconds(report.elapsed) << "\n";
}

LoggingConfig BuildLoggingConfig(const ReviewOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

ParsedDiff LoadDiff(const ReviewOptions &options,
                    const std::shared_ptr<Logger> &logger) {
  const UnifiedDiffParser parser(options.extensions.empty()
                                     ? DefaultSupportedExtensions()
                                     : options.extensions,
                                 logger);
  if (options.diff_file) {
    return parser.ParseFile(*options.diff_file);
  }
  GitDiffSource source(options.repository.value_or("."), logger);
  return parser.ParseCommit(source, options.commit.value_or(kDefaultCommit),
                            options.base);
}

ReviewPipeline BuildReviewPipeline(const ReviewOptions &options,
                                   const std::shared_ptr<Logger> &logger) {
  ReviewPipelineBuilder builder;
  builder.WithLogger(logger);
  builder.WithStageSpecs(ResolveStageSpecs(options));
  builder.WithFormats(options.formats.empty()
                          ? std::vector<std::string>{"markdown", "json"}
                          : options.formats);
  builder.WithOutputDirectory(
      options.output_directory.value_or(kDefaultOutputDirectory));
  return builder.Build();
}

int RunReview(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseReviewArguments(arguments);
  if (cli_options.show_help) {
    PrintReviewUsage();
    return kExitSuccess;
  }

  const auto merged = ResolveReviewOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  const auto diff = LoadDiff(merged, logger);
  if (diff.files.empty()) {
    logger->Log(LogLevel::kWarn, "review.nothing_to_analyze",
                {{"summary", diff.summary}});
    std::cout << "No supported files found in diff. Nothing to review.\n";
    return kExitSuccess;
  }
  std::cout << "Parsed " << DescribeDiff(diff) << "\n\n";

  auto pipeline = BuildReviewPipeline(merged, logger);
  const auto outcome = pipeline.Execute(diff);
  if (!outcome.success) {
    std::cerr << "Error: " << outcome.error << "\n";
    return ReviewExitCode(outcome, merged.fail_on);
  }

  PrintReviewSummary(outcome, std::cout);
  return ReviewExitCode(outcome, merged.fail_on);
}

int RunExtract(const std::vector<std::string> &arguments) {
  const auto options = ParseExtractArguments(arguments);
  if (options.show_help) {
    PrintExtractUsage();
    return kExitSuccess;
  }
  if (!options.report) {
    throw std::invalid_argument("extract requires the path of a report");
  }

  const auto findings = ExtractCheckedFindingsFromFile(*options.report);
  const auto content = options.format == "json"
                           ? FormatFindingsAsJson(findings) + "\n"
                           : FormatFindingsAsMarkdown(findings);

  if (!options.output_file) {
    std::cout << content;
    return kExitSuccess;
  }
  WriteTextFile(*options.output_file, content);
  std::cout << "Extracted " << findings.size() << " finding(s) to "
            << options.output_file->string() << "\n";
  return kExitSuccess;
}

} // namespace review
