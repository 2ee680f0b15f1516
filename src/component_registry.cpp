#include <review/component_registry.h>

#include <review/command_stage.h>
#include <review/json_renderer.h>
#include <review/markdown_renderer.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultStageKind[] = "command";
constexpr const char kMarkdownFormat[] = "markdown";
constexpr const char kJsonFormat[] = "json";

} // namespace

namespace review {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind) {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterStageKind(const std::string &kind,
                                          StageFactory factory,
                                          bool set_as_default) {
  RegisterComponent(kind, std::move(factory), set_as_default, stages_);
}

void ComponentRegistry::RegisterRenderer(const std::string &format,
                                         RendererFactory factory) {
  RegisterComponent(format, std::move(factory), false, renderers_);
}

std::unique_ptr<AnalysisStage>
ComponentRegistry::CreateStage(const StageSpec &spec,
                               std::shared_ptr<Logger> logger) const {
  const auto &factory = FindFactory(spec.kind, stages_, "stage kind");
  auto stage = factory(spec, std::move(logger));
  if (!stage) {
    throw std::runtime_error("Factory for stage '" + spec.name +
                             "' returned null");
  }
  return stage;
}

std::unique_ptr<ReportRenderer>
ComponentRegistry::CreateRenderer(const std::string &format) const {
  if (format.empty()) {
    throw std::invalid_argument("Output format cannot be empty");
  }
  const auto &factory = FindFactory(format, renderers_, "output format");
  auto renderer = factory();
  if (!renderer) {
    throw std::runtime_error("Factory for output format '" + format +
                             "' returned null");
  }
  return renderer;
}

std::vector<std::string> ComponentRegistry::StageKinds() const {
  return RegisteredNames(stages_);
}

std::vector<std::string> ComponentRegistry::RendererFormats() const {
  return RegisteredNames(renderers_);
}

const std::string &ComponentRegistry::DefaultStageKind() const {
  return stages_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterStageKind(
      kDefaultStageKind,
      [](const StageSpec &spec, std::shared_ptr<Logger> logger) {
        return std::make_unique<CommandStage>(spec, std::move(logger));
      },
      true);
  registry.RegisterRenderer(
      kMarkdownFormat, []() { return std::make_unique<MarkdownRenderer>(); });
  registry.RegisterRenderer(
      kJsonFormat, []() { return std::make_unique<JsonRenderer>(); });
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace review
