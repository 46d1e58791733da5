#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "core/class_metadata.hpp"
#include "core/config.hpp"
#include "detectors/frame_processor.hpp"

namespace fwp {

// Builds the detector selected by cfg.kind. Throws std::runtime_error if it can't be constructed
// (missing model, unreadable event log)
std::unique_ptr<Detector> MakeDetector(const DetectorConfig& cfg, const ClassMetadata& classes);

// MakeDetector wrapped in the shared per-frame steps (FPS, diagnostic overlay)
std::unique_ptr<AnnotatingProcessor> MakeFrameProcessor(const std::string& name,
                                                         const DetectorConfig& cfg,
                                                         const ClassMetadata& classes,
                                                         std::size_t fps_window = FpsCounter::kDefaultWindow);

} // namespace fwp
