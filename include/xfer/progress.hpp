#pragma once
#include <cstdint>
#include <string_view>

namespace xfer {

struct ProgressEvent {
    std::string_view stage;
    std::uint64_t done = 0;  // cumulative, never decreases within a stage
    std::uint64_t total = 0; // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace xfer
