#pragma once

#include <review/interfaces.h>
#include <review/logging.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace review {

class ComponentRegistry {
public:
  using StageFactory = std::function<std::unique_ptr<AnalysisStage>(
      const StageSpec &, std::shared_ptr<Logger>)>;
  using RendererFactory = std::function<std::unique_ptr<ReportRenderer>()>;

  void RegisterStageKind(const std::string &kind, StageFactory factory,
                         bool set_as_default = false);
  void RegisterRenderer(const std::string &format, RendererFactory factory);

  // An empty spec.kind selects the default stage kind.
  std::unique_ptr<AnalysisStage>
  CreateStage(const StageSpec &spec,
              std::shared_ptr<Logger> logger = nullptr) const;
  std::unique_ptr<ReportRenderer> CreateRenderer(const std::string &format) const;

  std::vector<std::string> StageKinds() const;
  std::vector<std::string> RendererFormats() const;

  const std::string &DefaultStageKind() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static const Factory &FindFactory(const std::string &name,
                                    const ComponentSet<Factory> &set,
                                    const std::string &kind);

  template <typename Factory>
  static void RegisterComponent(const std::string &name, Factory factory,
                                bool set_as_default,
                                ComponentSet<Factory> &set);

  ComponentSet<StageFactory> stages_;
  ComponentSet<RendererFactory> renderers_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace review
