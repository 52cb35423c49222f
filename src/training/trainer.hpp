/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "dataset.hpp"
#include "interval_schedule.hpp"
#include "optimizers/scheduler.hpp"
#include "rasterization/renderer.hpp"
#include "strategies/neighbor_graph.hpp"
#include "strategies/population_manager.hpp"
#include "telemetry.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <torch/torch.h>

namespace gsf::training {

    // Photometric loss between a render and its ground truth image
    using LossFn = std::function<torch::Tensor(const RenderOutput&, const torch::Tensor&)>;

    torch::Tensor l1_photometric_loss(const RenderOutput& render_output, const torch::Tensor& gt_image);

    struct EvaluationResult {
        std::string split;
        size_t num_views = 0;
        double l1 = 0.0;
        double psnr = 0.0;
    };

    class Trainer {
    public:
        Trainer(std::unique_ptr<PopulationManager> population,
                std::shared_ptr<IRenderer> renderer,
                std::shared_ptr<IViewSource> views,
                ITelemetrySink& telemetry,
                LossFn loss_fn = l1_photometric_loss);

        // Delete copy operations
        Trainer(const Trainer&) = delete;
        Trainer& operator=(const Trainer&) = delete;

        // Initialize trainer - must be called before training
        std::expected<void, std::string> initialize(const param::TrainingParameters& params);

        bool is_initialized() const { return initialized_; }

        // Runs iterations start+1 .. iterations and writes the final PLY
        std::expected<void, std::string> train(std::stop_token stop_token = {});

        // Mean L1 and PSNR over the test views and every 5th training view
        std::vector<EvaluationResult> evaluate(size_t iteration);

        size_t current_iteration() const { return current_iteration_; }
        size_t start_iteration() const { return start_iteration_; }
        TrainingPhase phase() const { return phase_at(params_.optimization, current_iteration_); }

        const PopulationManager& population() const { return *population_; }
        const NeighborGraph& neighbor_graph() const { return graph_; }
        const TrainingSchedule& schedule() const { return schedule_; }

        int64_t cumulative_created() const { return cum_created_; }
        int64_t cumulative_deleted() const { return cum_deleted_; }
        float ema_loss() const { return ema_loss_; }

    private:
        void train_step(size_t iter);

        torch::Tensor background_for_step();

        TrainingActions make_actions();

        void densify(size_t iter, std::optional<float> size_threshold);
        void refresh_graph(size_t iter);
        void save_ply(size_t iter);
        void save_checkpoint(size_t iter);

        std::unique_ptr<PopulationManager> population_;
        std::shared_ptr<IRenderer> renderer_;
        std::shared_ptr<IViewSource> views_;
        ITelemetrySink& telemetry_;
        LossFn loss_fn_;

        param::TrainingParameters params_;
        TrainingSchedule schedule_;
        std::optional<ExponentialDecayLR> position_lr_;
        std::optional<ViewSampler> sampler_;
        NeighborGraphBuilder graph_builder_;
        NeighborGraph graph_;
        torch::Tensor background_;
        torch::Device device_ = torch::kCPU;

        bool initialized_ = false;
        size_t start_iteration_ = 0;
        size_t current_iteration_ = 0;
        int64_t cum_created_ = 0;
        int64_t cum_deleted_ = 0;
        float ema_loss_ = 0.f;
    };
} // namespace gsf::training
