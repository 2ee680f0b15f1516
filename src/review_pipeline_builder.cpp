#include <review/review_pipeline_builder.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace review {

ReviewPipelineBuilder::ReviewPipelineBuilder(const ComponentRegistry &registry)
    : registry_(&registry) {}

ReviewPipelineBuilder &ReviewPipelineBuilder::WithStageSpec(StageSpec spec) {
  stages_.push_back(StageEntry{std::move(spec), nullptr});
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithStageSpecs(std::vector<StageSpec> specs) {
  for (auto &spec : specs) {
    WithStageSpec(std::move(spec));
  }
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithStage(std::unique_ptr<AnalysisStage> stage) {
  if (!stage) {
    throw std::invalid_argument("Stage cannot be null");
  }
  stages_.push_back(StageEntry{StageSpec{}, std::move(stage)});
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithFormats(std::vector<std::string> formats) {
  formats_ = std::move(formats);
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithRenderer(std::unique_ptr<ReportRenderer> renderer) {
  if (!renderer) {
    throw std::invalid_argument("Renderer cannot be null");
  }
  components_.renderers.push_back(std::move(renderer));
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithOutputDirectory(std::filesystem::path directory) {
  components_.output_directory = std::move(directory);
  return *this;
}

ReviewPipelineBuilder &
ReviewPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

ReviewPipeline ReviewPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));

  std::vector<std::string> names;
  for (auto &entry : stages_) {
    std::unique_ptr<AnalysisStage> stage;
    if (entry.stage) {
      stage = std::move(entry.stage);
    } else if (entry.spec.enabled) {
      stage = registry_->CreateStage(entry.spec, components_.logger);
    } else {
      components_.logger->Log(LogLevel::kDebug, "pipeline.stage.disabled",
                              {{"stage", entry.spec.name}});
      continue;
    }
    const auto name = stage->Name();
    if (std::find(names.begin(), names.end(), name) != names.end()) {
      throw std::invalid_argument("Duplicate stage name: " + name);
    }
    names.push_back(name);
    components_.stages.push_back(std::move(stage));
  }
  stages_.clear();

  std::vector<std::string> seen;
  for (const auto &format : formats_) {
    if (std::find(seen.begin(), seen.end(), format) != seen.end()) {
      continue;
    }
    seen.push_back(format);
    components_.renderers.push_back(registry_->CreateRenderer(format));
  }
  formats_.clear();

  return ReviewPipeline(std::move(components_));
}

} // namespace review
