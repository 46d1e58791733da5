#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "core/detections.hpp"

/*
    Structured-text record of detection events, keyed by processed frame index (1-based, in the order frames
    reached the detector). Written by CaptureWriter and read back by the replay_log detector.

    frames:
      - frame: 12
        events:
          - class_id: 0
            label: forklift
            confidence: 0.87
            region: [x, y, w, h]
*/

namespace fwp {

using EventLog = std::map<std::uint64_t, Detections>;

// YAML document holding a single frame's events
std::string FrameEventsToYaml(std::uint64_t frame_index, const Detections& events);

std::string EventLogToYaml(const EventLog& log);
EventLog EventLogFromYaml(const std::string& yaml);

// Throw std::runtime_error on I/O or format errors
void SaveEventLog(const std::string& path, const EventLog& log);
EventLog LoadEventLog(const std::string& path);

} // namespace fwp
