/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interval_schedule.hpp"
#include "core/parameters.hpp"
#include <algorithm>

namespace gsf::training {

    bool PeriodicTask::fires(size_t iteration) const {
        return std::any_of(triggers.begin(), triggers.end(),
                           [iteration](const Trigger& t) { return t.fires(iteration); });
    }

    IntervalSchedule& IntervalSchedule::add(PeriodicTask task) {
        _tasks.push_back(std::move(task));
        return *this;
    }

    std::vector<std::string> IntervalSchedule::due(size_t iteration) const {
        std::vector<std::string> names;
        for (const auto& task : _tasks) {
            if (task.fires(iteration)) {
                names.push_back(task.name);
            }
        }
        return names;
    }

    size_t IntervalSchedule::run(size_t iteration) const {
        size_t count = 0;
        for (const auto& task : _tasks) {
            if (task.action && task.fires(iteration)) {
                task.action(iteration);
                ++count;
            }
        }
        return count;
    }

    std::string_view phase_name(TrainingPhase phase) {
        switch (phase) {
        case TrainingPhase::Warmup: return "warmup";
        case TrainingPhase::Densifying: return "densifying";
        case TrainingPhase::PostDensification: return "post-densification";
        case TrainingPhase::Done: return "done";
        }
        return "unknown";
    }

    TrainingPhase phase_at(const param::OptimizationParameters& params, size_t iteration) {
        if (iteration < params.densify_from_iter) {
            return TrainingPhase::Warmup;
        }
        if (iteration < params.densify_until_iter) {
            return TrainingPhase::Densifying;
        }
        if (iteration <= params.iterations) {
            return TrainingPhase::PostDensification;
        }
        return TrainingPhase::Done;
    }

    std::vector<ScheduledEvent> plan_events(const TrainingSchedule& schedule, size_t first, size_t last) {
        std::vector<ScheduledEvent> events;
        for (size_t i = first; i <= last; ++i) {
            ScheduledEvent event{i, {}};
            for (const auto* hook : {&schedule.pre_render, &schedule.post_backward, &schedule.post_step}) {
                auto names = hook->due(i);
                event.tasks.insert(event.tasks.end(), names.begin(), names.end());
            }
            if (!event.tasks.empty()) {
                events.push_back(std::move(event));
            }
        }
        return events;
    }

    TrainingSchedule build_training_schedule(const param::OptimizationParameters& params,
                                             const TrainingActions& actions) {
        TrainingSchedule schedule;

        const auto at_each = [](const std::vector<size_t>& iterations) {
            std::vector<Trigger> triggers;
            triggers.reserve(iterations.size());
            for (const auto it : iterations) {
                triggers.push_back(Trigger::at(it));
            }
            return triggers;
        };

        schedule.pre_render.add({"sh_escalation",
                                 {Trigger{params.sh_degree_interval, params.sh_degree_interval}},
                                 actions.escalate_sh_degree});

        std::function<void(size_t)> densify;
        if (actions.densify) {
            densify = [densify_action = actions.densify,
                       from = params.size_threshold_from_iter,
                       max_screen_size = params.max_screen_size](size_t iteration) {
                const std::optional<float> size_threshold =
                    iteration > from ? std::optional<float>(max_screen_size) : std::nullopt;
                densify_action(iteration, size_threshold);
            };
        }
        schedule.post_backward.add({"densify",
                                    {Trigger{params.densification_interval, params.densify_from_iter, params.densify_until_iter}},
                                    densify});

        std::vector<Trigger> reset_triggers = {
            Trigger{params.opacity_reset_interval, params.densify_from_iter, params.densify_until_iter}};
        if (params.white_background && params.densify_from_iter < params.densify_until_iter) {
            reset_triggers.push_back(Trigger::at(params.densify_from_iter));
        }
        schedule.post_backward.add({"opacity_reset", std::move(reset_triggers), actions.reset_opacity});

        schedule.post_backward.add({"graph_refresh",
                                    {Trigger{params.knn_refresh_interval, params.densify_until_iter, params.iterations + 1}},
                                    actions.refresh_graph});

        std::vector<size_t> save_iterations = params.save_iterations;
        save_iterations.push_back(params.iterations);
        std::sort(save_iterations.begin(), save_iterations.end());
        save_iterations.erase(std::unique(save_iterations.begin(), save_iterations.end()), save_iterations.end());

        schedule.post_step.add({"save", at_each(save_iterations), actions.save});
        schedule.post_step.add({"checkpoint", at_each(params.checkpoint_iterations), actions.checkpoint});
        schedule.post_step.add({"evaluate", at_each(params.test_iterations), actions.evaluate});

        return schedule;
    }
} // namespace gsf::training
