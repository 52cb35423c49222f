/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/errors.hpp"
#include "splat_test_utils.hpp"
#include "strategies/population_manager.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <torch/torch.h>

using namespace gsf;
using namespace gsf::training;

class PopulationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(42);
        params = test::make_test_params();
    }

    std::unique_ptr<PopulationManager> make_manager(SplatData&& splat) {
        return std::make_unique<PopulationManager>(std::move(splat), params);
    }

    static void expect_aligned(const PopulationManager& manager) {
        const int64_t n = manager.size();
        EXPECT_EQ(manager.stats().size(), n);
        EXPECT_EQ(manager.optimizer().size(), n);
        EXPECT_EQ(manager.splat_data().types().size(0), n);
        for (auto id : kAllParams) {
            EXPECT_EQ(manager.splat_data().param(id).size(0), n) << param_name(id);
            EXPECT_EQ(manager.optimizer().state(id).exp_avg.size(0), n) << param_name(id);
            EXPECT_EQ(manager.optimizer().state(id).exp_avg_sq.size(0), n) << param_name(id);
        }
    }

    // Gives every parameter a gradient of one and takes an optimizer step, so that all moments are non-zero
    static void take_unit_step(PopulationManager& manager) {
        torch::Tensor loss = torch::zeros({});
        for (auto id : kAllParams) {
            loss = loss + manager.splat_data().param(id).sum();
        }
        loss.backward();
        manager.step();
    }

    param::OptimizationParameters params;
    const float scene_extent = 10.f; // percent_dense * extent = 0.5
};

TEST_F(PopulationManagerTest, ScenarioA_SmallHighGradientPrimitivesAreCloned) {
    constexpr int64_t n = 1000;
    auto manager = make_manager(test::make_uniform_splat(n, 0.3f, 0.5f));

    auto grads = torch::zeros({n});
    grads.slice(0, 0, 50).fill_(0.0003f);
    manager->update_stats(test::make_render_output(grads));

    const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                   scene_extent, std::nullopt, std::nullopt);

    EXPECT_EQ(report.num_cloned, 50);
    EXPECT_EQ(report.num_split, 0);
    EXPECT_EQ(report.size_after_growth, 1050);
    EXPECT_EQ(report.num_pruned, 0);
    EXPECT_EQ(report.size_after, 1050);
    EXPECT_EQ(manager->size(), 1050);
    expect_aligned(*manager);

    // Clones are exact copies of their parents, appended after the survivors
    const auto& means = manager->splat_data().means();
    EXPECT_TRUE(torch::allclose(means.slice(0, n, n + 50), means.slice(0, 0, 50)));
}

TEST_F(PopulationManagerTest, ScenarioB_LargeHighGradientPrimitivesAreSplit) {
    constexpr int64_t n = 1000;
    auto scales = torch::full({n}, 0.3f);
    scales.slice(0, 40, 50).fill_(0.8f);
    auto manager = make_manager(test::make_splat(torch::rand({n, 3}) * 10.f, scales, torch::full({n}, 0.5f)));
    const auto split_rows = torch::arange(40, 50, torch::kInt64);
    const auto parent_means = manager->splat_data().means().detach().index_select(0, split_rows);
    const auto parent_rotmats = quat_to_rotmat(manager->splat_data().rotation_raw().detach().index_select(0, split_rows));

    auto grads = torch::zeros({n});
    grads.slice(0, 0, 50).fill_(0.0003f);
    manager->update_stats(test::make_render_output(grads));

    const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                   scene_extent, std::nullopt, std::nullopt);

    EXPECT_EQ(report.num_cloned, 40);
    EXPECT_EQ(report.num_split, 10);
    EXPECT_EQ(report.created, 60);
    EXPECT_EQ(report.deleted, 10);
    EXPECT_EQ(report.size_after, 1050);
    expect_aligned(*manager);

    // 20 split children at the end, each scaled down by the divisor
    const auto children_scale = manager->splat_data().get_scaling().slice(0, 1050 - 20, 1050);
    EXPECT_TRUE(torch::allclose(children_scale, torch::full_like(children_scale, 0.8f / params.split_scale_divisor), 1e-4, 1e-5));

    // Split parents are gone from the survivors
    const auto survivor_scale = manager->splat_data().get_scaling().slice(0, 0, 1050 - 60);
    EXPECT_LT(survivor_scale.max().item<float>(), 0.31f);

    // Children are laid out [first child of each parent..., second child of each parent...]
    // and sit at parent + R * (eps * s) with eps ~ N(0, I)
    const auto children_means = manager->splat_data().means().detach().slice(0, 1050 - 20, 1050);
    const auto offsets = children_means - parent_means.repeat({2, 1});
    EXPECT_TRUE((offsets.norm(2, -1) > 0.f).all().item<bool>());
    EXPECT_FALSE(torch::allclose(children_means.slice(0, 0, 10), children_means.slice(0, 10, 20)));

    const auto local = torch::bmm(parent_rotmats.repeat({2, 1, 1}).transpose(1, 2), offsets.unsqueeze(-1)).squeeze(-1) / 0.8f;
    EXPECT_LT(local.abs().max().item<float>(), 5.f);
}

TEST_F(PopulationManagerTest, ScenarioC_ResetOpacityClampsToFloor) {
    constexpr int64_t n = 500;
    auto opacities = torch::rand({n}) * 0.98f + 0.001f;
    auto manager = make_manager(test::make_splat(torch::rand({n, 3}), torch::full({n}, 0.1f), opacities));
    const auto before = manager->splat_data().get_opacity().detach().clone();

    manager->reset_opacity();

    const auto after = manager->splat_data().get_opacity();
    EXPECT_EQ(manager->size(), n);
    EXPECT_LE(after.max().item<float>(), params.opacity_reset_value + 1e-6f);

    // Already transparent primitives are untouched
    const auto below = before < params.opacity_reset_value;
    EXPECT_TRUE(torch::allclose(after.masked_select(below), before.masked_select(below)));
}

TEST_F(PopulationManagerTest, ResetOpacityIsIdempotent) {
    constexpr int64_t n = 200;
    auto manager = make_manager(test::make_splat(torch::rand({n, 3}), torch::full({n}, 0.1f), torch::rand({n}) * 0.9f + 0.05f));
    take_unit_step(*manager);
    const auto moment_before = manager->optimizer().state(ParamId::Opacity).exp_avg.clone();

    manager->reset_opacity();
    const auto once = manager->splat_data().opacity_raw().detach().clone();
    manager->reset_opacity();
    const auto twice = manager->splat_data().opacity_raw().detach().clone();

    EXPECT_TRUE(torch::equal(once, twice));
    EXPECT_TRUE(torch::equal(moment_before, manager->optimizer().state(ParamId::Opacity).exp_avg));
}

TEST_F(PopulationManagerTest, ScenarioD_CapRemovesLeastOpaqueSurvivors) {
    constexpr int64_t n = 1000;
    // Rows 0..49 fall under min_opacity, the rest are distinct and increasing
    auto opacities = torch::linspace(0.2f, 0.9f, n);
    opacities.slice(0, 0, 50).fill_(0.001f);
    auto manager = make_manager(test::make_splat(torch::rand({n, 3}) * 10.f, torch::full({n}, 0.3f), opacities));

    // The 100 most opaque rows get cloned
    auto grads = torch::zeros({n});
    grads.slice(0, n - 100, n).fill_(0.001f);
    manager->update_stats(test::make_render_output(grads));

    const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                   scene_extent, std::nullopt, int64_t{1000});

    EXPECT_EQ(report.size_after_growth, 1100);
    EXPECT_EQ(report.num_pruned, 50);
    EXPECT_EQ(report.num_capped, 50);
    EXPECT_EQ(report.size_after, 1000);
    EXPECT_EQ(manager->size(), 1000);
    expect_aligned(*manager);

    // Survivors before the cap are rows 50..999 plus clones of the top 100; the 50 least opaque are rows 50..99
    const float cut = opacities[100].item<float>();
    EXPECT_GE(manager->splat_data().get_opacity().min().item<float>(), cut - 1e-5f);
}

TEST_F(PopulationManagerTest, CapNeverGrowsAndHoldsAcrossRounds) {
    constexpr int64_t n = 300;
    auto manager = make_manager(test::make_uniform_splat(n, 0.3f, 0.5f));

    for (int round = 0; round < 3; ++round) {
        manager->update_stats(test::make_render_output(torch::full({manager->size()}, 0.001f)));
        const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                       scene_extent, std::nullopt, int64_t{350});
        EXPECT_LE(report.size_after, 350);
        EXPECT_LE(manager->size(), 350);
        expect_aligned(*manager);
    }
}

TEST_F(PopulationManagerTest, ZeroCapEmptiesThePopulation) {
    auto manager = make_manager(test::make_uniform_splat(50));
    manager->update_stats(test::make_render_output(torch::zeros({50})));

    const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                   scene_extent, std::nullopt, int64_t{0});

    // A zero cap is accepted as configured and removes everything
    EXPECT_EQ(report.size_after, 0);
    EXPECT_EQ(manager->size(), 0);
    expect_aligned(*manager);
}

TEST_F(PopulationManagerTest, NewbornMomentsFollowWarmStartRule) {
    constexpr int64_t n = 20;
    auto scales = torch::full({n}, 0.3f);
    scales[1] = 0.8f; // split
    auto manager = make_manager(test::make_splat(torch::rand({n, 3}), scales, torch::full({n}, 0.5f)));
    take_unit_step(*manager);

    auto grads = torch::zeros({n});
    grads[0] = 0.001f; // clone
    grads[1] = 0.001f;
    manager->update_stats(test::make_render_output(grads));

    const auto parent_moment = manager->optimizer().state(ParamId::Means).exp_avg[0].clone();
    manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense, scene_extent, std::nullopt, std::nullopt);

    // Layout: 19 survivors, then the clone of row 0, then two children of row 1
    ASSERT_EQ(manager->size(), 22);
    const auto& exp_avg = manager->optimizer().state(ParamId::Means).exp_avg;
    EXPECT_TRUE(torch::allclose(exp_avg[19], parent_moment));
    EXPECT_TRUE(torch::equal(exp_avg.slice(0, 20, 22), torch::zeros({2, 3})));
    EXPECT_TRUE(exp_avg.slice(0, 0, 19).ne(0).all().item<bool>());
}

TEST_F(PopulationManagerTest, StatisticsAreResetAfterDensify) {
    constexpr int64_t n = 100;
    auto manager = make_manager(test::make_uniform_splat(n));
    auto grads = torch::zeros({n});
    grads.slice(0, 0, 10).fill_(0.001f);
    manager->update_stats(test::make_render_output(grads));

    manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense, scene_extent, std::nullopt, std::nullopt);

    EXPECT_EQ(manager->stats().denom().sum().item<float>(), 0.f);
    EXPECT_EQ(manager->stats().grad_accum().sum().item<float>(), 0.f);
}

TEST_F(PopulationManagerTest, SizeThresholdPrunesLargeFootprints) {
    constexpr int64_t n = 100;
    auto scales = torch::full({n}, 0.3f);
    scales.slice(0, 0, 5).fill_(2.f); // > prune_scale3d * extent = 1.0
    auto manager = make_manager(test::make_splat(torch::rand({n, 3}), scales, torch::full({n}, 0.5f)));

    auto radii = torch::zeros({n});
    radii.slice(0, 5, 8).fill_(50.f);
    manager->update_stats(test::make_render_output(torch::zeros({n}), {}, radii));

    const auto without = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                    scene_extent, std::nullopt, std::nullopt);
    EXPECT_EQ(without.num_pruned, 0);

    manager->update_stats(test::make_render_output(torch::zeros({n}), {}, radii));
    const auto with = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                 scene_extent, 20.f, std::nullopt);
    EXPECT_EQ(with.num_pruned, 8);
    EXPECT_EQ(manager->size(), n - 8);
    expect_aligned(*manager);
}

TEST_F(PopulationManagerTest, UnchangedPopulationKeepsGeneration) {
    auto manager = make_manager(test::make_uniform_splat(50));
    const auto generation = manager->splat_data().generation();
    manager->update_stats(test::make_render_output(torch::zeros({50})));

    const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                   scene_extent, std::nullopt, std::nullopt);

    EXPECT_EQ(report.size_after, 50);
    EXPECT_EQ(manager->splat_data().generation(), generation);
}

TEST_F(PopulationManagerTest, EmptyPopulationIsNoOp) {
    auto manager = make_manager(test::make_uniform_splat(0));

    const auto report = manager->densify_and_prune(params.densify_grad_threshold, params.percent_dense,
                                                   scene_extent, 20.f, int64_t{10});

    EXPECT_EQ(report.size_before, 0);
    EXPECT_EQ(report.size_after, 0);
    EXPECT_EQ(report.created, 0);
    EXPECT_EQ(report.deleted, 0);
    EXPECT_EQ(manager->size(), 0);
}

TEST_F(PopulationManagerTest, MissingThresholdIsConfigurationError) {
    auto manager = make_manager(test::make_uniform_splat(10));

    EXPECT_THROW(manager->densify_and_prune(std::nullopt, 0.05f, scene_extent, std::nullopt, std::nullopt),
                 ConfigurationError);
    EXPECT_THROW(manager->densify_and_prune(std::numeric_limits<float>::quiet_NaN(), 0.05f, scene_extent,
                                            std::nullopt, std::nullopt),
                 ConfigurationError);
    EXPECT_THROW(manager->densify_and_prune(0.0002f, std::nullopt, scene_extent, std::nullopt, std::nullopt),
                 ConfigurationError);
    EXPECT_EQ(manager->size(), 10);
}

TEST_F(PopulationManagerTest, EscalateShDegreeStopsAtMaximum) {
    auto manager = make_manager(test::make_uniform_splat(10));

    EXPECT_EQ(manager->splat_data().get_active_sh_degree(), 0);
    EXPECT_TRUE(manager->escalate_sh_degree());
    EXPECT_EQ(manager->splat_data().get_active_sh_degree(), 1);
    EXPECT_FALSE(manager->escalate_sh_degree());
    EXPECT_EQ(manager->splat_data().get_active_sh_degree(), 1);
}

TEST_F(PopulationManagerTest, CaptureRestoreRoundTrip) {
    constexpr int64_t n = 30;
    auto manager = make_manager(test::make_uniform_splat(n));
    take_unit_step(*manager);
    manager->escalate_sh_degree();
    auto checkpoint = manager->capture(77);

    auto other = make_manager(test::make_uniform_splat(5));
    const auto generation = other->splat_data().generation();
    EXPECT_EQ(other->restore(std::move(checkpoint)), 77);

    EXPECT_EQ(other->size(), n);
    EXPECT_GT(other->splat_data().generation(), generation);
    EXPECT_EQ(other->splat_data().get_active_sh_degree(), 1);
    EXPECT_TRUE(torch::equal(other->splat_data().means(), manager->splat_data().means()));
    EXPECT_TRUE(torch::equal(other->optimizer().state(ParamId::Means).exp_avg,
                             manager->optimizer().state(ParamId::Means).exp_avg));
    EXPECT_EQ(other->optimizer().state(ParamId::Means).step_count, 1);
    EXPECT_TRUE(other->splat_data().means().requires_grad());
    expect_aligned(*other);
}

TEST_F(PopulationManagerTest, RestoreRejectsMismatchedCheckpoint) {
    auto manager = make_manager(test::make_uniform_splat(10));

    auto wrong_degree = manager->capture(1);
    wrong_degree.max_sh_degree = 3;
    EXPECT_THROW(manager->restore(std::move(wrong_degree)), CheckpointFormatError);

    auto wrong_rows = manager->capture(1);
    wrong_rows.params[to_index(ParamId::Opacity)] = wrong_rows.params[to_index(ParamId::Opacity)].slice(0, 0, 5);
    EXPECT_THROW(manager->restore(std::move(wrong_rows)), CheckpointFormatError);

    EXPECT_EQ(manager->size(), 10);
}
