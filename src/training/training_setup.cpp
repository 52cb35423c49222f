/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "training_setup.hpp"
#include "core/logger.hpp"
#include "core/splat_data.hpp"
#include <format>

namespace gsf::training {

    std::expected<std::unique_ptr<ITelemetrySink>, std::string> setup_telemetry(const param::TrainingParameters& params) {
        auto backend = parse_telemetry_backend(params.optimization.telemetry);
        if (!backend) {
            return std::unexpected(backend.error());
        }

        try {
            auto sink = make_telemetry_sink(*backend, params.output_path);
            LOG_DEBUG("Telemetry backend: {}", params.optimization.telemetry);
            return sink;
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to create telemetry sink: {}", e.what()));
        }
    }

    std::expected<std::unique_ptr<PopulationManager>, std::string> setup_population(
        const param::TrainingParameters& params,
        const PointCloud& seed,
        float scene_extent) {

        if (auto valid = param::validate_parameters(params.optimization); !valid) {
            return std::unexpected(std::format("Invalid configuration: {}", valid.error()));
        }

        auto splat_result = SplatData::init_model_from_pointcloud(params, seed, scene_extent);
        if (!splat_result) {
            return std::unexpected(std::format("Failed to initialize model: {}", splat_result.error()));
        }

        auto population = std::make_unique<PopulationManager>(std::move(*splat_result), params.optimization);
        LOG_DEBUG("Created population manager with {} primitives", population->size());
        return population;
    }

    std::expected<TrainingSetup, std::string> setup_training(const param::TrainingParameters& params,
                                                             const PointCloud& seed,
                                                             std::shared_ptr<IRenderer> renderer,
                                                             std::shared_ptr<IViewSource> views,
                                                             LossFn loss_fn) {
        if (!renderer || !views) {
            return std::unexpected("Training setup requires a renderer and a view source");
        }

        auto telemetry = setup_telemetry(params);
        if (!telemetry) {
            return std::unexpected(telemetry.error());
        }

        auto population = setup_population(params, seed, views->scene_extent());
        if (!population) {
            return std::unexpected(population.error());
        }

        TrainingSetup setup;
        setup.telemetry = std::move(*telemetry);
        setup.trainer = std::make_unique<Trainer>(std::move(*population),
                                                  std::move(renderer),
                                                  std::move(views),
                                                  *setup.telemetry,
                                                  std::move(loss_fn));
        return setup;
    }
} // namespace gsf::training
