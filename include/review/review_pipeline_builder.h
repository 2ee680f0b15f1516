#pragma once

#include <review/component_registry.h>
#include <review/interfaces.h>
#include <review/logging.h>
#include <review/review_pipeline.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace review {

class ReviewPipelineBuilder {
public:
  explicit ReviewPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  // Specs and pre-built stages keep the order in which they were added.
  ReviewPipelineBuilder &WithStageSpec(StageSpec spec);
  ReviewPipelineBuilder &WithStageSpecs(std::vector<StageSpec> specs);
  ReviewPipelineBuilder &WithStage(std::unique_ptr<AnalysisStage> stage);
  ReviewPipelineBuilder &WithFormats(std::vector<std::string> formats);
  ReviewPipelineBuilder &
  WithRenderer(std::unique_ptr<ReportRenderer> renderer);
  ReviewPipelineBuilder &WithOutputDirectory(std::filesystem::path directory);
  ReviewPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);

  // Throws std::invalid_argument for an unknown stage kind or format.
  ReviewPipeline Build();

private:
  struct StageEntry {
    StageSpec spec;
    std::unique_ptr<AnalysisStage> stage;
  };

  const ComponentRegistry *registry_;
  std::vector<StageEntry> stages_;
  std::vector<std::string> formats_;
  PipelineComponents components_;
};

} // namespace review
