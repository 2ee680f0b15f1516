#pragma once

#include <review/models.h>

#include <optional>

namespace review {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitFindingsAtThreshold = 2;

// 1 when the pipeline could not run; 2 when |fail_on| is set and a finding at
// or above that severity was reported; 0 otherwise.
int ReviewExitCode(const PipelineOutcome &outcome,
                   const std::optional<Severity> &fail_on);

} // namespace review
