#pragma once
#include "core/LayerSink.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

// Keeps the latest gradient of every layer so the service can hand it to a
// renderer on request.
class InMemoryLayerSink final : public LayerSink {
public:
  void add_layer(const std::string &layer_id) override;
  bool has_layer(const std::string &layer_id) const override;
  void set_line_gradient(const std::string &layer_id,
                         const GradientStops &stops) override;
  bool remove_layer(const std::string &layer_id) override;

  std::optional<GradientStops> gradient(const std::string &layer_id) const;
  uint64_t update_count(const std::string &layer_id) const;
  std::size_t layer_count() const;

  // {"<id>": {"updates": n, "line-gradient": <expression or null>}, ...}
  nlohmann::json snapshot() const;

private:
  struct Layer {
    std::optional<GradientStops> stops;
    uint64_t updates = 0;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Layer> layers_;
};
