#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
    LatestStore holds only the most recent value written to it.

    Watchers hand their processed frames to the main thread through one of these (see LatestFrameSink). The
    watcher never waits for the display: a write just replaces whatever the main thread hasn't picked up yet, so
    a slow or blocked window costs dropped display frames instead of stalling the catch-up loop.

    Readers track the version they last consumed and ask only for something newer.
*/

namespace fwp {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  void write(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = std::move(value);
    ++version_;
  }

  std::optional<T> read_latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    return latest_;
  }

  // Returns the value only if it was written after 'seen_version', and advances seen_version
  std::optional<T> read_if_newer(std::uint64_t& seen_version) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!latest_ || version_ == seen_version) return std::nullopt;
    seen_version = version_;
    return latest_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
  }

private:
  mutable std::mutex mu_;
  std::optional<T> latest_;
  std::uint64_t version_{0};
};

} // namespace fwp
