#pragma once

namespace lc::types { struct History; }

namespace lc::history {

// Sink for terminal delivery outcomes. Implementations may throw; callers log
// the failure and carry on.
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;

    virtual void record(const types::History& entry) = 0;
};

}
