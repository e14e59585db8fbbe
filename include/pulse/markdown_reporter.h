#pragma once

#include <pulse/interfaces.h>

#include <optional>
#include <string>

namespace pulse {

// Renders a Report as Markdown and/or JSON. Percentages and hours are
// rounded to one decimal here and nowhere else.
class MarkdownReporter : public Reporter {
public:
  Rendering Render(const Report &report,
                   const RenderOptions &options) override;
};

std::string FormatOneDecimal(double value);
std::string FormatOptional(const std::optional<double> &value,
                           const std::string &missing = "n/a");

} // namespace pulse
