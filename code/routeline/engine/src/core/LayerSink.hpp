#pragma once
#include "models/CoreTypes.hpp"
#include <string>

// Rendering side of the route line: named line layers whose colour ramp can
// be replaced. Implementations must tolerate calls from the animation thread.
class LayerSink {
public:
  virtual ~LayerSink() = default;

  virtual void add_layer(const std::string &layer_id) = 0;
  virtual bool has_layer(const std::string &layer_id) const = 0;
  // No-op for a layer the sink does not hold.
  virtual void set_line_gradient(const std::string &layer_id,
                                 const GradientStops &stops) = 0;
  // Returns false when there was no such layer.
  virtual bool remove_layer(const std::string &layer_id) = 0;
};
