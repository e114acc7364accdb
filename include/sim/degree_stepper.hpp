// degree_stepper.hpp - advance a run one degree of separation per step
#pragma once

#include "core/config.hpp"
#include "sim/layer_index.hpp"
#include "sim/reachability.hpp"

namespace sim {

/**
 * @brief Replays a run frame by frame, one depth per step.
 * @details The walk follows the run, not the bounded view: it ends at the
 * run's stop depth (the depth whose frontier came up empty, or max_depth),
 * which is also the last frame write_frames_dot emits. Depths past the
 * view's last layer still yield frames, with an empty frontier.
 * step() advances and returns false (without moving) once the stop depth
 * is shown. The index and reach must outlive the stepper.
 */
class DegreeStepper {
public:
    DegreeStepper(const LayerIndex& index, const Reach& reach)
        : index_(&index), stop_(reach.stop_depth()), empty_(reach.empty()) {}

    [[nodiscard]] depth_t depth() const noexcept { return t_; }
    [[nodiscard]] depth_t stop_depth() const noexcept { return stop_; }
    [[nodiscard]] FrameState current() const noexcept { return index_->frame(t_); }

    [[nodiscard]] bool done() const noexcept { return empty_ || t_ >= stop_; }

    bool step() noexcept {
        if (done()) return false;
        ++t_;
        return true;
    }

    void reset() noexcept { t_ = 0; }

private:
    const LayerIndex* index_;
    depth_t stop_;
    bool empty_;
    depth_t t_{0};
};

} // namespace sim
