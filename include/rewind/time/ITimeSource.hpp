#pragma once
#include <cstdint>

namespace rwd::time {

// Wall-clock source for chunk timestamps and eviction cutoffs.
// Injected so eviction and export windows can be tested deterministically.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace rwd::time
