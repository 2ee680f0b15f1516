#pragma once

#include <review/models.h>

#include <optional>
#include <string>

namespace review {

struct StageSpec {
  std::string name;
  std::string kind = "command";
  std::string command;
  bool enabled = true;
};

struct DiffText {
  std::string text;
  std::optional<DiffStat> stat;
};

// Version-control collaborator: turns a commit (against its parent, or
// against |base| when given) into unified diff text.
class DiffProvider {
public:
  virtual ~DiffProvider() = default;
  virtual DiffText Diff(const std::string &commit,
                        const std::optional<std::string> &base) = 0;
};

class AnalysisStage {
public:
  virtual ~AnalysisStage() = default;
  virtual std::string Name() const = 0;
  // Called for every stage before the first one runs. Throwing here aborts
  // the whole pipeline.
  virtual void Prepare() {}
  virtual StageResult Run(const StageContext &context) = 0;
};

class ReportRenderer {
public:
  virtual ~ReportRenderer() = default;
  virtual std::string Format() const = 0;
  virtual std::string FileExtension() const = 0;
  virtual std::string Render(const Report &report) = 0;
};

} // namespace review
