#pragma once

#include <string>

namespace fillsched {

struct ProgressEvent {
    std::string strategy;
    int placed{0};
    int total{0};
    std::string message;
};

// Optional observer handed to Strategy::plan. Purely informational.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void onProgress(const ProgressEvent& event) = 0;
};

inline void notify(ProgressSink* sink, const std::string& strategy, int placed, int total, const std::string& message) {
    if (sink) sink->onProgress(ProgressEvent{strategy, placed, total, message});
}

} // namespace fillsched
