#include "apps/render_sink.hpp"

#include <opencv2/highgui.hpp>

namespace fwp {

void WindowSink::show(const std::string& window, const cv::Mat& frame) {
  if (frame.empty()) return;
  cv::imshow(window, frame);

  const int key = cv::waitKey(1) & 0xFF;
  if ((key == 'q' || key == 27) && quit_) quit_->request_stop();
}

void LatestFrameSink::show(const std::string& window, const cv::Mat& frame) {
  store_->write(RenderFrame{window, frame});
}

} // namespace fwp
