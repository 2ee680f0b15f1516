#pragma once

#include <review/interfaces.h>

namespace review {

// Human-readable report. Findings are rendered as unchecked checklist items
// that ExtractCheckedFindings understands once a reviewer ticks them.
class MarkdownRenderer : public ReportRenderer {
public:
  std::string Format() const override { return "markdown"; }
  std::string FileExtension() const override { return ".md"; }
  std::string Render(const Report &report) override;
};

} // namespace review
