/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "interval_schedule.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace gsf;
using namespace gsf::training;

namespace {
    param::OptimizationParameters make_params() {
        param::OptimizationParameters params;
        params.iterations = 30'000;
        params.sh_degree_interval = 1'000;
        params.densify_from_iter = 500;
        params.densify_until_iter = 15'000;
        params.densification_interval = 100;
        params.opacity_reset_interval = 3'000;
        params.size_threshold_from_iter = 3'000;
        params.max_screen_size = 20.f;
        params.knn_refresh_interval = 3'000;
        params.save_iterations = {7'000};
        params.checkpoint_iterations = {5'000};
        params.test_iterations = {7'000, 30'000};
        return params;
    }

    bool contains(const std::vector<std::string>& names, const std::string& name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    // Iterations in [1, last] at which the given task runs
    std::vector<size_t> fired(const IntervalSchedule& schedule, const std::string& name, size_t last) {
        std::vector<size_t> result;
        for (size_t i = 1; i <= last; ++i) {
            if (contains(schedule.due(i), name)) {
                result.push_back(i);
            }
        }
        return result;
    }
} // namespace

TEST(TriggerTest, FiresInsideHalfOpenWindow) {
    const Trigger trigger{100, 500, 15'000};

    EXPECT_FALSE(trigger.fires(400));
    EXPECT_TRUE(trigger.fires(500));
    EXPECT_FALSE(trigger.fires(550));
    EXPECT_TRUE(trigger.fires(14'900));
    EXPECT_FALSE(trigger.fires(15'000));
}

TEST(TriggerTest, AtFiresExactlyOnce) {
    const auto trigger = Trigger::at(42);

    EXPECT_FALSE(trigger.fires(41));
    EXPECT_TRUE(trigger.fires(42));
    EXPECT_FALSE(trigger.fires(43));
    EXPECT_FALSE(trigger.fires(84));
}

TEST(IntervalScheduleTest, OverlappingTriggersRunActionOnce) {
    int calls = 0;
    IntervalSchedule schedule;
    schedule.add({"task", {Trigger{10, 0, 100}, Trigger::at(20)}, [&calls](size_t) { ++calls; }});

    EXPECT_EQ(schedule.run(20), 1u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(schedule.run(21), 0u);
    EXPECT_EQ(calls, 1);
}

TEST(IntervalScheduleTest, RunsInRegistrationOrder) {
    std::vector<std::string> order;
    IntervalSchedule schedule;
    schedule.add({"first", {Trigger{5}}, [&order](size_t) { order.push_back("first"); }})
        .add({"second", {Trigger{5}}, [&order](size_t) { order.push_back("second"); }})
        .add({"silent", {Trigger{5}}, {}});

    EXPECT_EQ(schedule.due(10), (std::vector<std::string>{"first", "second", "silent"}));
    EXPECT_EQ(schedule.run(10), 2u);
    EXPECT_EQ(order, (std::vector<std::string>{"first", "second"}));
}

TEST(TrainingScheduleTest, DensifyWindowIsHalfOpen) {
    const auto params = make_params();
    const auto schedule = build_training_schedule(params, {});
    const auto densify = fired(schedule.post_backward, "densify", params.iterations);

    ASSERT_FALSE(densify.empty());
    EXPECT_EQ(densify.front(), 500u);
    EXPECT_EQ(densify.back(), 14'900u);
    EXPECT_EQ(densify.size(), 145u);
}

TEST(TrainingScheduleTest, DensifyReceivesSizeThresholdAfterItsStart) {
    auto params = make_params();
    std::vector<std::pair<size_t, std::optional<float>>> calls;
    TrainingActions actions;
    actions.densify = [&calls](size_t i, std::optional<float> size_threshold) {
        calls.emplace_back(i, size_threshold);
    };
    const auto schedule = build_training_schedule(params, actions);

    schedule.post_backward.run(3'000);
    schedule.post_backward.run(3'100);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_FALSE(calls[0].second.has_value());
    ASSERT_TRUE(calls[1].second.has_value());
    EXPECT_FLOAT_EQ(*calls[1].second, 20.f);
}

TEST(TrainingScheduleTest, OpacityResetInsideDensificationWindow) {
    const auto params = make_params();
    const auto schedule = build_training_schedule(params, {});

    EXPECT_EQ(fired(schedule.post_backward, "opacity_reset", params.iterations),
              (std::vector<size_t>{3'000, 6'000, 9'000, 12'000}));
}

TEST(TrainingScheduleTest, WhiteBackgroundAddsResetAtDensifyStart) {
    auto params = make_params();
    params.white_background = true;
    params.densify_from_iter = 3'000;

    int calls = 0;
    TrainingActions actions;
    actions.reset_opacity = [&calls](size_t) { ++calls; };
    const auto schedule = build_training_schedule(params, actions);

    // Both triggers are true at 3000; the reset still runs once
    schedule.post_backward.run(3'000);
    EXPECT_EQ(calls, 1);

    EXPECT_EQ(fired(schedule.post_backward, "opacity_reset", params.iterations).front(), 3'000u);
}

TEST(TrainingScheduleTest, GraphRefreshOnlyAfterDensification) {
    const auto params = make_params();
    const auto schedule = build_training_schedule(params, {});

    EXPECT_EQ(fired(schedule.post_backward, "graph_refresh", params.iterations),
              (std::vector<size_t>{15'000, 18'000, 21'000, 24'000, 27'000, 30'000}));
}

TEST(TrainingScheduleTest, ShEscalationEveryInterval) {
    const auto params = make_params();
    const auto schedule = build_training_schedule(params, {});
    const auto escalations = fired(schedule.pre_render, "sh_escalation", 5'000);

    EXPECT_EQ(escalations, (std::vector<size_t>{1'000, 2'000, 3'000, 4'000, 5'000}));
}

TEST(TrainingScheduleTest, FinalIterationIsAlwaysSaved) {
    const auto params = make_params();
    const auto schedule = build_training_schedule(params, {});

    EXPECT_EQ(fired(schedule.post_step, "save", params.iterations), (std::vector<size_t>{7'000, 30'000}));
    EXPECT_EQ(fired(schedule.post_step, "checkpoint", params.iterations), (std::vector<size_t>{5'000}));
    EXPECT_EQ(fired(schedule.post_step, "evaluate", params.iterations), (std::vector<size_t>{7'000, 30'000}));
}

TEST(TrainingScheduleTest, PlanEventsListsTasksInExecutionOrder) {
    const auto params = make_params();
    const auto schedule = build_training_schedule(params, {});
    const auto events = plan_events(schedule, 2'999, 3'000);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].iteration, 3'000u);
    EXPECT_EQ(events[0].tasks, (std::vector<std::string>{"sh_escalation", "densify", "opacity_reset"}));
}

TEST(TrainingPhaseTest, PhaseBoundaries) {
    const auto params = make_params();

    EXPECT_EQ(phase_at(params, 1), TrainingPhase::Warmup);
    EXPECT_EQ(phase_at(params, 499), TrainingPhase::Warmup);
    EXPECT_EQ(phase_at(params, 500), TrainingPhase::Densifying);
    EXPECT_EQ(phase_at(params, 14'999), TrainingPhase::Densifying);
    EXPECT_EQ(phase_at(params, 15'000), TrainingPhase::PostDensification);
    EXPECT_EQ(phase_at(params, 30'000), TrainingPhase::PostDensification);
    EXPECT_EQ(phase_at(params, 30'001), TrainingPhase::Done);
    EXPECT_EQ(phase_name(TrainingPhase::PostDensification), "post-densification");
}
