#include "infra/InMemoryLayerSink.hpp"
#include "core/GradientBuilder.hpp"

void InMemoryLayerSink::add_layer(const std::string &layer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  layers_.emplace(layer_id, Layer{});
}

bool InMemoryLayerSink::has_layer(const std::string &layer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return layers_.count(layer_id) != 0;
}

void InMemoryLayerSink::set_line_gradient(const std::string &layer_id,
                                          const GradientStops &stops) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = layers_.find(layer_id);
  if (it == layers_.end())
    return;
  it->second.stops = stops;
  ++it->second.updates;
}

bool InMemoryLayerSink::remove_layer(const std::string &layer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return layers_.erase(layer_id) != 0;
}

std::optional<GradientStops>
InMemoryLayerSink::gradient(const std::string &layer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = layers_.find(layer_id);
  if (it == layers_.end())
    return std::nullopt;
  return it->second.stops;
}

uint64_t InMemoryLayerSink::update_count(const std::string &layer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = layers_.find(layer_id);
  return it == layers_.end() ? 0 : it->second.updates;
}

std::size_t InMemoryLayerSink::layer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return layers_.size();
}

nlohmann::json InMemoryLayerSink::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json out = nlohmann::json::object();
  for (const auto &kv : layers_) {
    out[kv.first] = {
        {"updates", kv.second.updates},
        {"line-gradient", kv.second.stops
                              ? GradientBuilder::to_expression(*kv.second.stops)
                              : nlohmann::json()}};
  }
  return out;
}
