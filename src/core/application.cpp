/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/point_cloud.hpp"
#include "training/checkpoint.hpp"
#include "training/dataset.hpp"
#include "training/interval_schedule.hpp"
#include "training/training_setup.hpp"
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace gsf {

    namespace {
        std::string join(const std::vector<std::string>& names) {
            std::string out;
            for (const auto& name : names) {
                out += out.empty() ? name : ", " + name;
            }
            return out;
        }

        int run_plan(const param::TrainingParameters& params) {
            const auto& opt = params.optimization;

            auto valid = param::validate_parameters(opt);
            if (!valid) {
                LOG_ERROR("Invalid configuration {}: {}", opt.config_file, valid.error());
                return -1;
            }

            // No actions: the schedule is only inspected, never run
            const auto schedule = training::build_training_schedule(opt, training::TrainingActions{});

            std::println("Configuration: {}", opt.config_file);
            std::println("Phases:");
            std::println("  {:<20} [1, {})", training::phase_name(training::TrainingPhase::Warmup), opt.densify_from_iter);
            std::println("  {:<20} [{}, {})", training::phase_name(training::TrainingPhase::Densifying),
                         opt.densify_from_iter, opt.densify_until_iter);
            std::println("  {:<20} [{}, {}]", training::phase_name(training::TrainingPhase::PostDensification),
                         opt.densify_until_iter, opt.iterations);
            std::println("Events:");

            const auto events = training::plan_events(schedule, 1, opt.iterations);
            for (const auto& event : events) {
                std::println("  {:>8}  [{}]  {}", event.iteration,
                             training::phase_name(training::phase_at(opt, event.iteration)), join(event.tasks));
            }
            LOG_DEBUG("{} scheduled iterations", events.size());
            return 0;
        }

        int run_init(const param::TrainingParameters& params,
                     const std::filesystem::path& seed_path,
                     std::optional<float> scene_extent) {
            auto seed = load_point_cloud_ply(seed_path);
            if (!seed) {
                LOG_ERROR("{}", seed.error());
                return -1;
            }

            auto telemetry = training::setup_telemetry(params);
            if (!telemetry) {
                LOG_ERROR("{}", telemetry.error());
                return -1;
            }

            try {
                // Without cameras the seed cloud's own spread stands in for the scene extent
                const float extent = scene_extent ? *scene_extent : training::compute_scene_extent(seed->means);
                if (!(extent > 0.f)) {
                    LOG_ERROR("Scene extent of the seed cloud is {}, pass --scene-extent", extent);
                    return -1;
                }

                auto population = training::setup_population(params, *seed, extent);
                if (!population) {
                    LOG_ERROR("{}", population.error());
                    return -1;
                }

                if (auto saved = param::save_training_parameters_to_json(params, params.output_path); !saved) {
                    LOG_ERROR("{}", saved.error());
                    return -1;
                }

                const auto checkpoint_path = params.output_path / "chkpnt0.pt";
                if (auto saved = training::save_checkpoint((*population)->capture(0), checkpoint_path); !saved) {
                    LOG_ERROR("{}", saved.error());
                    return -1;
                }

                const auto& splat_data = (*population)->splat_data();
                (*telemetry)->log_scalar("n_gaussians", static_cast<double>(splat_data.size()), 0);
                (*telemetry)->flush();

                std::println("Seeded {} primitives ({} surface, {} generic), scene extent {:.4f}",
                             splat_data.size(),
                             splat_data.count(PrimitiveType::Surface),
                             splat_data.count(PrimitiveType::Generic),
                             extent);
                std::println("Starting checkpoint: {}", checkpoint_path.string());
                return 0;
            } catch (const std::exception& e) {
                LOG_ERROR("Initialization failed: {}", e.what());
                return -1;
            }
        }

        int run_inspect(const std::filesystem::path& checkpoint_path) {
            auto checkpoint = training::load_checkpoint(checkpoint_path);
            if (!checkpoint) {
                LOG_ERROR("{}", checkpoint.error());
                return -1;
            }

            try {
                training::validate_checkpoint(*checkpoint);
            } catch (const CheckpointFormatError& e) {
                LOG_ERROR("{}", e.what());
                return -1;
            }

            const auto summary = training::summarize_checkpoint(*checkpoint);
            std::println("Checkpoint:      {}", checkpoint_path.string());
            std::println("Iteration:       {}", summary.iteration);
            std::println("Primitives:      {} ({} surface, {} generic)", summary.size, summary.num_surface, summary.num_generic);
            std::println("SH degree:       {} of {}", summary.active_sh_degree, summary.max_sh_degree);
            std::println("Scene scale:     {:.4f}", summary.scene_scale);
            std::println("Optimizer steps: {}", summary.optimizer_steps);
            std::println("Opacity:         min {:.4f} mean {:.4f} max {:.4f}",
                         summary.opacity_min, summary.opacity_mean, summary.opacity_max);
            return 0;
        }

        int run_export(const std::filesystem::path& checkpoint_path, const std::filesystem::path& output_path) {
            auto checkpoint = training::load_checkpoint(checkpoint_path);
            if (!checkpoint) {
                LOG_ERROR("{}", checkpoint.error());
                return -1;
            }

            try {
                const auto splat_data = training::make_splat_data(*checkpoint, torch::kCPU, /*requires_grad=*/false);
                splat_data.save_ply(output_path);
                LOG_INFO("Exported {} primitives to {}", splat_data.size(), output_path.string());
                return 0;
            } catch (const std::exception& e) {
                LOG_ERROR("Export failed: {}", e.what());
                return -1;
            }
        }
    } // namespace

    int Application::run(std::unique_ptr<args::CommandLine> cmd) {
        switch (cmd->command) {
        case args::Command::Plan:
            return run_plan(cmd->params);
        case args::Command::Init:
            return run_init(cmd->params, cmd->seed_path, cmd->scene_extent);
        case args::Command::Inspect:
            return run_inspect(cmd->checkpoint_path);
        case args::Command::Export:
            return run_export(cmd->checkpoint_path, cmd->export_path);
        case args::Command::Help:
            return 0;
        }
        return -1;
    }
} // namespace gsf
