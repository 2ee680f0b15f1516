#include <review/cli_exit_codes.h>

namespace review {

int ReviewExitCode(const PipelineOutcome &outcome,
                   const std::optional<Severity> &fail_on) {
  if (!outcome.success || !outcome.report) {
    return kExitFailure;
  }
  if (!fail_on) {
    return kExitSuccess;
  }
  for (const auto &stage : outcome.report->stages) {
    for (const auto &finding : stage.findings) {
      if (AtLeast(finding.severity, *fail_on)) {
        return kExitFindingsAtThreshold;
      }
    }
  }
  return kExitSuccess;
}

} // namespace review
