/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace gsf {
    namespace param {
        struct OptimizationParameters {
            size_t iterations = 30'000;
            int sh_degree = 3;
            size_t sh_degree_interval = 1'000;

            // Learning rates. Position decays exponentially from init to final over max_steps.
            float position_lr_init = 0.00016f;
            float position_lr_final = 0.0000016f;
            float position_lr_delay_mult = 0.01f;
            size_t position_lr_delay_steps = 0;
            size_t position_lr_max_steps = 30'000;
            float feature_lr = 0.0025f; // shN uses feature_lr / 20
            float opacity_lr = 0.05f;
            float scaling_lr = 0.005f;
            float rotation_lr = 0.001f;

            // Densification window [densify_from_iter, densify_until_iter)
            size_t densify_from_iter = 500;
            size_t densify_until_iter = 15'000;
            size_t densification_interval = 100;
            std::optional<float> densify_grad_threshold = 0.0002f;
            std::optional<float> percent_dense = 0.05f;
            float split_scale_divisor = 1.6f;
            bool reset_stats_after_densify = true;

            // Pruning
            float min_opacity = 0.005f;
            float max_screen_size = 20.f;         // size threshold in pixels, active after size_threshold_from_iter
            size_t size_threshold_from_iter = 3'000;
            float prune_scale3d = 0.1f;           // world-space prune as a fraction of the scene extent
            std::optional<int64_t> max_population = std::nullopt;

            // Opacity reset
            size_t opacity_reset_interval = 3'000;
            float opacity_reset_value = 0.01f;
            bool white_background = false;
            bool random_background = false;

            // Neighbour graph and surface alignment
            int knn_neighbors = 10;
            size_t knn_refresh_interval = 3'000;
            float lambda_pair_distance = 0.05f;
            float lambda_pair_normal = 0.01f;

            // Initialisation
            float init_opacity = 0.1f;
            std::string init_primitive_type = "surface"; // surface, generic

            // Outputs
            std::vector<size_t> test_iterations = {7'000, 30'000};
            std::vector<size_t> save_iterations = {7'000, 30'000};
            std::vector<size_t> checkpoint_iterations = {};
            size_t log_every = 10;
            std::string telemetry = "none"; // none, local
            float steps_scaler = 0.f;       // scales all step counts when > 0

            std::string config_file = "";

            nlohmann::json to_json() const;
            static OptimizationParameters from_json(const nlohmann::json& j);
        };

        struct TrainingParameters {
            OptimizationParameters optimization;

            std::filesystem::path output_path = "";

            // Resume from a checkpoint written by a previous run
            std::optional<std::filesystem::path> start_checkpoint = std::nullopt;
        };

        std::expected<OptimizationParameters, std::string> read_optim_params_from_json(const std::filesystem::path& path);

        // Checks thresholds, intervals and iteration boundaries before training starts
        std::expected<void, std::string> validate_parameters(const OptimizationParameters& params);

        std::expected<void, std::string> save_training_parameters_to_json(
            const TrainingParameters& params,
            const std::filesystem::path& output_path);
    } // namespace param
} // namespace gsf
