#pragma once

#include <pulse/models.h>

namespace pulse {

// Harvest collaborator. Supplies the raw events of one Period already
// materialised in memory; connectivity is the caller's concern.
class EventSource {
public:
  virtual ~EventSource() = default;
  virtual RawEventBatch Fetch(const Period &period) = 0;
};

// Delivery collaborator. Receives only the assembled Report.
class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Rendering Render(const Report &report,
                           const RenderOptions &options) = 0;
};

} // namespace pulse
