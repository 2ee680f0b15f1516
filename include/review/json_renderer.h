#pragma once

#include <review/interfaces.h>

namespace review {

class JsonRenderer : public ReportRenderer {
public:
  std::string Format() const override { return "json"; }
  std::string FileExtension() const override { return ".json"; }
  std::string Render(const Report &report) override;
};

} // namespace review
