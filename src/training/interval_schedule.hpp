/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gsf::param {
    struct OptimizationParameters;
}

namespace gsf::training {

    // Fires at iteration i when from <= i < until and i % every == 0
    struct Trigger {
        size_t every = 1;
        size_t from = 0;
        size_t until = std::numeric_limits<size_t>::max();

        bool fires(size_t iteration) const {
            return iteration >= from && iteration < until && every > 0 && iteration % every == 0;
        }

        static Trigger at(size_t iteration) { return Trigger{1, iteration, iteration + 1}; }
    };

    // A periodic behaviour. Several triggers firing on the same iteration run the action once.
    struct PeriodicTask {
        std::string name;
        std::vector<Trigger> triggers;
        std::function<void(size_t)> action;

        bool fires(size_t iteration) const;
    };

    class IntervalSchedule {
    public:
        IntervalSchedule& add(PeriodicTask task);

        // Names of the tasks firing at this iteration, in registration order
        std::vector<std::string> due(size_t iteration) const;

        // Runs every firing task in registration order and returns how many ran
        size_t run(size_t iteration) const;

        const std::vector<PeriodicTask>& tasks() const { return _tasks; }

    private:
        std::vector<PeriodicTask> _tasks;
    };

    enum class TrainingPhase {
        Warmup,
        Densifying,
        PostDensification,
        Done
    };

    std::string_view phase_name(TrainingPhase phase);

    TrainingPhase phase_at(const param::OptimizationParameters& params, size_t iteration);

    struct TrainingActions {
        std::function<void(size_t)> escalate_sh_degree;
        std::function<void(size_t, std::optional<float>)> densify; // iteration, size threshold
        std::function<void(size_t)> reset_opacity;
        std::function<void(size_t)> refresh_graph;
        std::function<void(size_t)> save;
        std::function<void(size_t)> checkpoint;
        std::function<void(size_t)> evaluate;
    };

    // Per-iteration hooks, in loop order
    struct TrainingSchedule {
        IntervalSchedule pre_render;    // before the render pass
        IntervalSchedule post_backward; // after the statistics update, before the optimizer step
        IntervalSchedule post_step;     // after the optimizer step
    };

    struct ScheduledEvent {
        size_t iteration = 0;
        std::vector<std::string> tasks; // in execution order across the three hooks
    };

    // Every iteration in [first, last] at which at least one task fires
    std::vector<ScheduledEvent> plan_events(const TrainingSchedule& schedule, size_t first, size_t last);

    TrainingSchedule build_training_schedule(const param::OptimizationParameters& params,
                                             const TrainingActions& actions);
} // namespace gsf::training
