#pragma once

#include <string>

#include "core/frame.hpp"

namespace fwp {

// Something frames can be pulled from: a camera, a video file, a test fixture
class FrameSource {
public:
  virtual ~FrameSource() = default;

  // Fills 'out' with the next frame. Returns false when the source is exhausted
  virtual bool read(Frame& out) = 0;

  virtual std::string describe() const = 0;
};

} // namespace fwp
