// **********************************************************************
// sbridge/include/DelayLine.hpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
Fixed-depth ring buffer standing in for a propagation delay.
shift(x) at tick t returns what was shifted in at tick t-depth.
Depth 0 is a wire.
*/
#pragma once
#include <cstddef>
#include <vector>

namespace sbridge {

template <typename T>
class DelayLine {
public:
  explicit DelayLine(int depth = 0, const T& fill = T())
    : depth_(depth < 0 ? 0 : depth), ring_((size_t)(depth < 0 ? 0 : depth), fill), out_(fill) {}

  const T& shift(const T& in) {
    if (depth_ == 0) {
      out_ = in;
      return out_;
    }
    out_ = ring_[head_];
    ring_[head_] = in;
    head_ = (head_ + 1) % ring_.size();
    return out_;
  }

  void reset(const T& fill) {
    for (auto &v : ring_) v = fill;
    head_ = 0;
    out_ = fill;
  }

  const T& out() const { return out_; }
  int depth()    const { return depth_; }

private:
  int            depth_ = 0;
  std::vector<T> ring_;
  size_t         head_ = 0;
  T              out_;
};

} // namespace sbridge
