#pragma once

#include <memory>
#include <string>
#include <utility>

#include <opencv2/core.hpp>

#include "infra/latest_store.hpp"
#include "infra/stop_token.hpp"

/*
    Where processed frames go to be looked at.

    WindowSink shows frames directly with highgui. It is meant for the synchronous driver, which already runs on
    the main thread. 'q' or ESC in the window requests a stop on the given StopSource.

    LatestFrameSink is for watcher threads: it only replaces the latest frame in a LatestStore and the main thread
    displays from there (highgui must stay on the main thread on some platforms).
*/

namespace fwp {

class RenderSink {
public:
  virtual ~RenderSink() = default;
  virtual void show(const std::string& window, const cv::Mat& frame) = 0;
};

struct RenderFrame {
  std::string window;
  cv::Mat image;
};

class WindowSink final : public RenderSink {
public:
  explicit WindowSink(StopSource* quit = nullptr) : quit_(quit) {}

  void show(const std::string& window, const cv::Mat& frame) override;

private:
  StopSource* quit_;
};

class LatestFrameSink final : public RenderSink {
public:
  explicit LatestFrameSink(std::shared_ptr<LatestStore<RenderFrame>> store) : store_(std::move(store)) {}

  void show(const std::string& window, const cv::Mat& frame) override;

private:
  std::shared_ptr<LatestStore<RenderFrame>> store_;
};

} // namespace fwp
