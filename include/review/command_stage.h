#pragma once

#include <review/interfaces.h>
#include <review/logging.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace review {

class StageFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct FindingsPayload {
  std::vector<Finding> findings;
  std::optional<TokenUsage> token_usage;
};

// JSON document written to a stage command's stdin.
std::string SerializeStageContext(const std::string &stage_name,
                                  const StageContext &context);

// Accepts either a JSON array of findings or an object with "findings" and
// "token_usage" members. Entries that are not valid findings are dropped.
// Throws StageFailure when no array of findings can be recovered.
FindingsPayload ParseFindingsPayload(const std::string &output,
                                     Logger &logger);

// Delegates analysis to an external executable: the stage context goes to
// its stdin as JSON, findings come back on stdout.
class CommandStage : public AnalysisStage {
public:
  explicit CommandStage(StageSpec spec,
                        std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return spec_.name; }
  void Prepare() override;
  StageResult Run(const StageContext &context) override;

private:
  StageSpec spec_;
  std::shared_ptr<Logger> logger_;
};

} // namespace review
