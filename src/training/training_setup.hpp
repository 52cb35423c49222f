/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "core/point_cloud.hpp"
#include "dataset.hpp"
#include "rasterization/renderer.hpp"
#include "strategies/population_manager.hpp"
#include "telemetry.hpp"
#include "trainer.hpp"
#include <expected>
#include <memory>
#include <string>

namespace gsf::training {
    struct TrainingSetup {
        // Outlives the trainer, which logs through a reference to it
        std::unique_ptr<ITelemetrySink> telemetry;
        std::unique_ptr<Trainer> trainer;
    };

    // Sink named by params.optimization.telemetry, writing into params.output_path
    std::expected<std::unique_ptr<ITelemetrySink>, std::string> setup_telemetry(const param::TrainingParameters& params);

    // Validates the configuration and seeds the population from a point cloud
    std::expected<std::unique_ptr<PopulationManager>, std::string> setup_population(
        const param::TrainingParameters& params,
        const PointCloud& seed,
        float scene_extent);

    // Wires sink, population and trainer together. The trainer still needs initialize().
    std::expected<TrainingSetup, std::string> setup_training(const param::TrainingParameters& params,
                                                             const PointCloud& seed,
                                                             std::shared_ptr<IRenderer> renderer,
                                                             std::shared_ptr<IViewSource> views,
                                                             LossFn loss_fn = {});
} // namespace gsf::training
