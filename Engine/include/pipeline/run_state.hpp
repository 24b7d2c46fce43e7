/**
 * @file run_state.hpp
 * @brief Forward-only phase tracking for a pipeline run
 */

#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace Driftwatch {

enum class PipelineState {
    Init,
    Detecting,
    Deciding,
    Executing,
    Reporting,
    Done
};

inline std::string to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Init:      return "INIT";
        case PipelineState::Detecting: return "DETECTING";
        case PipelineState::Deciding:  return "DECIDING";
        case PipelineState::Executing: return "EXECUTING";
        case PipelineState::Reporting: return "REPORTING";
        case PipelineState::Done:      return "DONE";
    }
    return "UNKNOWN";
}

/**
 * @brief Phases may be skipped but never revisited.
 */
class RunStateMachine {
public:
    PipelineState state() const { return state_.load(); }

    /**
     * @throws std::logic_error if next is not strictly after the current state
     */
    void advance(PipelineState next) {
        PipelineState current = state_.load();
        if (static_cast<int>(next) <= static_cast<int>(current)) {
            throw std::logic_error("Illegal pipeline transition " + to_string(current) + " -> " + to_string(next));
        }
        state_.store(next);
    }

private:
    std::atomic<PipelineState> state_{PipelineState::Init};
};

} // namespace Driftwatch
