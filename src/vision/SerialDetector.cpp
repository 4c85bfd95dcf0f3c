/* @file SerialDetector.cpp
 * @brief JSON-lines detection frames from the vision co-processor
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// PFD headers
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"
#include "vision/SerialDetector.hpp"

using namespace pfd::vision;
using nlohmann::json;

SerialDetector::SerialDetector(std::unique_ptr<io::SerialChannel> channel,
                               std::chrono::milliseconds pollTimeout,
                               std::shared_ptr<core::Logger> logger)
    : channel_(std::move(channel)), pollTimeout_(pollTimeout), logger_(std::move(logger)) {
  assert(channel_ && "[SerialDetector] channel is nullptr");
  assert(logger_ && "[SerialDetector] logger is nullptr");
}

SerialDetector::~SerialDetector() = default;

std::optional<std::vector<Detection>> SerialDetector::parseFrame(const std::string& line) {
  const json doc = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object())
    return std::nullopt;

  auto it = doc.find("detections");
  if (it == doc.end() || !it->is_array())
    return std::nullopt;

  std::vector<Detection> out;
  out.reserve(it->size());
  for (const auto& entry : *it) {
    if (!entry.is_object())
      continue;

    const auto cls = entry.contains("class") && entry["class"].is_string()
                         ? detectionClassFromString(entry["class"].get<std::string>())
                         : std::nullopt;
    if (!cls)
      continue;

    const auto& conf = entry.value("confidence", json());
    const auto& box = entry.value("box", json());
    if (!conf.is_number() || !box.is_array() || box.size() != 4)
      continue;

    bool numeric = true;
    for (const auto& v : box)
      numeric = numeric && v.is_number();
    if (!numeric)
      continue;

    Detection det;
    det.cls = *cls;
    det.confidence = conf.get<float>();
    det.box = core::BoundingBox{ box[0].get<double>(), box[1].get<double>(), box[2].get<double>(),
                                 box[3].get<double>() };
    if (!det.box.valid() || det.confidence < 0.0f || det.confidence > 1.0f)
      continue;

    out.push_back(det);
  }
  return out;
}

std::vector<Detection> SerialDetector::poll() {
  if (!channel_->isOpen())
    throw DetectorError("[SerialDetector] detector link is closed");

  auto line = channel_->readLine(pollTimeout_);
  if (!line) {
    if (!channel_->isOpen())
      throw DetectorError("[SerialDetector] detector link lost");
    return {}; // no frame this tick
  }

  // keep only the newest frame already waiting in the buffer
  while (auto next = channel_->readLine(std::chrono::milliseconds{ 0 }))
    line = std::move(next);

  auto frame = parseFrame(*line);
  if (!frame) {
    logger_->warn("SerialDetector", "discarding malformed frame: " + line->substr(0, 120));
    return {};
  }
  return *frame;
}
