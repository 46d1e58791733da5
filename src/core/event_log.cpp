#include "core/event_log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace fwp {

static void EmitEvents(YAML::Emitter& out, const Detections& events) {
  out << YAML::BeginSeq;
  for (const auto& e : events) {
    out << YAML::BeginMap;
    out << YAML::Key << "class_id" << YAML::Value << e.class_id;
    out << YAML::Key << "label" << YAML::Value << e.label;
    out << YAML::Key << "confidence" << YAML::Value << e.confidence;
    out << YAML::Key << "region" << YAML::Value << YAML::Flow << YAML::BeginSeq
        << e.region.x << e.region.y << e.region.w << e.region.h << YAML::EndSeq;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
}

static void EmitFrame(YAML::Emitter& out, std::uint64_t frame_index, const Detections& events) {
  out << YAML::BeginMap;
  out << YAML::Key << "frame" << YAML::Value << frame_index;
  out << YAML::Key << "events" << YAML::Value;
  EmitEvents(out, events);
  out << YAML::EndMap;
}

static Detections ParseEvents(const YAML::Node& n, std::uint64_t frame_index) {
  Detections out;
  if (!n) return out;
  if (!n.IsSequence()) {
    throw std::runtime_error("event log: frame " + std::to_string(frame_index) + " events must be a list");
  }
  out.reserve(n.size());
  for (const auto& en : n) {
    DetectionEvent e;
    e.class_id = en["class_id"].as<std::int32_t>(-1);
    e.label = en["label"].as<std::string>("");
    e.confidence = en["confidence"].as<float>(0.f);

    const YAML::Node r = en["region"];
    if (!r || !r.IsSequence() || r.size() != 4) {
      throw std::runtime_error("event log: frame " + std::to_string(frame_index) + " has an event without a [x, y, w, h] region");
    }
    e.region.x = r[0].as<float>();
    e.region.y = r[1].as<float>();
    e.region.w = r[2].as<float>();
    e.region.h = r[3].as<float>();
    out.push_back(std::move(e));
  }
  return out;
}

std::string FrameEventsToYaml(std::uint64_t frame_index, const Detections& events) {
  YAML::Emitter out;
  EmitFrame(out, frame_index, events);
  return out.c_str();
}

std::string EventLogToYaml(const EventLog& log) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "frames" << YAML::Value << YAML::BeginSeq;
  for (const auto& kv : log) EmitFrame(out, kv.first, kv.second);
  out << YAML::EndSeq;
  out << YAML::EndMap;
  return out.c_str();
}

EventLog EventLogFromYaml(const std::string& yaml) {
  EventLog log;
  try {
    const YAML::Node root = YAML::Load(yaml);
    const YAML::Node frames = root["frames"];
    if (!frames) return log;
    if (!frames.IsSequence()) throw std::runtime_error("event log: 'frames' must be a list");

    for (const auto& fn : frames) {
      if (!fn["frame"]) throw std::runtime_error("event log: entry without 'frame' index");
      const auto idx = fn["frame"].as<std::uint64_t>();
      log[idx] = ParseEvents(fn["events"], idx);
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("event log: ") + e.what());
  }
  return log;
}

void SaveEventLog(const std::string& path, const EventLog& log) {
  std::ofstream out(path);
  if (!out.is_open()) throw std::runtime_error("failed to open event log for writing: " + path);
  out << EventLogToYaml(log) << "\n";
  if (!out) throw std::runtime_error("failed to write event log: " + path);
}

EventLog LoadEventLog(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("failed to open event log: " + path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return EventLogFromYaml(text);
}

} // namespace fwp
